#pragma once
#ifndef VKRES_HANDLE_HPP
#define VKRES_HANDLE_HPP

#include <cinttypes>

namespace vkres {

// Pack index and in-pack item index of one item of kind T. Packs into 64 bits as (pack << 32) | item.
template <typename T, typename Data> struct Handle {
	inline static constexpr uint32_t kItemBits = 32;
	inline static constexpr uint64_t kItemMask = (uint64_t{1} << kItemBits) - 1;

	uint32_t pack{0}, item{0};

	inline static constexpr Handle FromRaw(uint64_t raw) {
		return {static_cast<uint32_t>(raw >> kItemBits), static_cast<uint32_t>(raw & kItemMask)};
	}
	inline constexpr uint64_t GetRaw() const { return (uint64_t{pack} << kItemBits) | uint64_t{item}; }
	inline constexpr bool operator==(const Handle &) const = default;
};

} // namespace vkres

#endif
