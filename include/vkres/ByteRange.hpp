#pragma once
#ifndef VKRES_BYTERANGE_HPP
#define VKRES_BYTERANGE_HPP

#include <volk.h>

#include <cassert>
#include <cinttypes>
#include <optional>

namespace vkres {

template <typename T> inline constexpr T DivCeil(T l, T r) { return (l / r) + (l % r ? 1 : 0); }

// Rounds offset up to the next multiple of alignment; an alignment of 0 or 1 leaves it unchanged
inline constexpr VkDeviceSize AlignUp(VkDeviceSize offset, VkDeviceSize alignment) {
	return alignment > 1 ? DivCeil(offset, alignment) * alignment : offset;
}

template <typename T> struct Range;

// Half-open byte interval [beg, end)
struct ByteRange {
	VkDeviceSize beg{0}, end{0};

	inline static constexpr ByteRange Empty() { return {}; }
	inline static constexpr ByteRange FromSize(VkDeviceSize size) { return {0, size}; }

	inline constexpr VkDeviceSize Size() const { return end - beg; }
	inline constexpr bool IsEmpty() const { return beg == end; }
	inline constexpr bool Contains(const ByteRange &other) const { return beg <= other.beg && other.end <= end; }
	inline constexpr bool Overlaps(const ByteRange &other) const { return beg < other.end && other.beg < end; }

	// Aligns the start of this range in place, keeping end fixed when possible
	inline constexpr ByteRange &Align(VkDeviceSize alignment) {
		beg = AlignUp(beg, alignment);
		if (end < beg)
			end = beg;
		return *this;
	}

	// Appends [AlignUp(end), AlignUp(end) + length) and grows this range to cover it
	inline constexpr ByteRange Extend(VkDeviceSize length, VkDeviceSize alignment) {
		VkDeviceSize offset = AlignUp(end, alignment);
		ByteRange appended{offset, offset + length};
		end = appended.end;
		return appended;
	}

	// Carves [AlignUp(beg), AlignUp(beg) + size) from the front, or std::nullopt if it does not fit before end
	inline constexpr std::optional<ByteRange> Alloc(VkDeviceSize size, VkDeviceSize alignment) {
		VkDeviceSize offset = AlignUp(beg, alignment);
		if (offset > end || size > end - offset)
			return std::nullopt;
		beg = offset + size;
		return ByteRange{offset, offset + size};
	}

	template <typename T> inline constexpr Range<T> Extend(std::size_t count);
	template <typename T> inline constexpr std::optional<Range<T>> Take(std::size_t count);

	inline constexpr bool operator==(const ByteRange &) const = default;
};

// Element range [first, first + len) of T inside a linear buffer
template <typename T> struct Range {
	std::size_t first{0}, len{0};

	inline static constexpr Range FromByteRange(const ByteRange &range) {
		assert(range.beg % sizeof(T) == 0 && range.Size() % sizeof(T) == 0);
		return {static_cast<std::size_t>(range.beg / sizeof(T)), static_cast<std::size_t>(range.Size() / sizeof(T))};
	}
	inline constexpr ByteRange GetByteRange() const {
		return {static_cast<VkDeviceSize>(first * sizeof(T)), static_cast<VkDeviceSize>((first + len) * sizeof(T))};
	}
	inline constexpr bool operator==(const Range &) const = default;
};

template <typename T> inline constexpr Range<T> ByteRange::Extend(std::size_t count) {
	return Range<T>::FromByteRange(Extend(count * sizeof(T), sizeof(T)));
}
template <typename T> inline constexpr std::optional<Range<T>> ByteRange::Take(std::size_t count) {
	auto range = Alloc(count * sizeof(T), sizeof(T));
	if (!range)
		return std::nullopt;
	return Range<T>::FromByteRange(*range);
}

} // namespace vkres

#endif
