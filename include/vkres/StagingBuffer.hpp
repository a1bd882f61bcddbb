#pragma once
#ifndef VKRES_STAGINGBUFFER_HPP
#define VKRES_STAGINGBUFFER_HPP

#include "Buffer.hpp"
#include "DefaultAllocator.hpp"

#include <cstring>
#include <span>

namespace vkres {

class StagingBuffer;

// Lays out the contents of a staging buffer before it exists
class StagingBufferBuilder {
private:
	ByteRange m_range{};

public:
	template <typename T> inline Range<T> Append(std::size_t count) { return m_range.Extend<T>(count); }
	inline ByteRange AppendBytes(VkDeviceSize size, VkDeviceSize alignment) { return m_range.Extend(size, alignment); }
	inline VkDeviceSize GetSize() const { return m_range.end; }

	ResourceResult<StagingBuffer> Build(Context &ctx) const;
};

// Transient host coherent source of device uploads, with its own DefaultAllocator
class StagingBuffer {
private:
	DefaultAllocator m_allocator;
	PersistentBuffer m_buffer;

	friend class StagingBufferBuilder;

public:
	inline StagingBuffer() = default;
	inline StagingBuffer(StagingBuffer &&) noexcept = default;
	inline StagingBuffer &operator=(StagingBuffer &&) noexcept = default;

	inline VkBuffer GetHandle() const { return m_buffer.GetHandle(); }
	inline VkDeviceSize GetSize() const { return m_buffer.GetSize(); }

	template <typename T> inline void Write(const Range<T> &range, std::span<const T> data) {
		assert(data.size() == range.len);
		WriteBytes(range.GetByteRange(), data.data());
	}
	inline void WriteBytes(const ByteRange &range, const void *data) {
		assert(range.end <= m_buffer.GetSize());
		if (range.Size())
			std::memcpy(m_buffer.GetMappedData() + range.beg, data, range.Size());
	}

	// Blocking device copies out of this buffer
	ResourceResult<void> CopyToBuffer(Context &ctx, VkBuffer dst, std::span<const VkBufferCopy> regions) const;
	ResourceResult<void> CopyToImage(Context &ctx, VkImage dst, const VkBufferImageCopy &region,
	                                 VkImageLayout final_layout) const;

	ResourceResult<void> Destroy(Context &ctx);
};

} // namespace vkres

#endif
