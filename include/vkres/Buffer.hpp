#pragma once
#ifndef VKRES_BUFFER_HPP
#define VKRES_BUFFER_HPP

#include "Allocator.hpp"
#include "ErrorMacro.hpp"

#include <utility>
#include <vector>

namespace vkres {

template <MemoryProperties M> class Buffer {
private:
	ResourceIndex<BufferRaw> m_index{};
	VkBuffer m_buffer{VK_NULL_HANDLE};
	VkDeviceSize m_size{0};
	MemoryChunk<M> m_memory{};

public:
	inline Buffer() = default;
	inline Buffer(const ResourceIndex<BufferRaw> &index, VkBuffer buffer, VkDeviceSize size, const MemoryChunk<M> &memory)
	    : m_index{index}, m_buffer{buffer}, m_size{size}, m_memory{memory} {}

	inline const ResourceIndex<BufferRaw> &GetIndex() const { return m_index; }
	inline VkBuffer GetHandle() const { return m_buffer; }
	inline VkDeviceSize GetSize() const { return m_size; }
	inline const MemoryChunk<M> &GetMemory() const { return m_memory; }
	inline bool IsNull() const { return m_buffer == VK_NULL_HANDLE; }

	// Destroys the buffer before handing its memory back to the allocator
	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) {
		if (IsNull())
			return {};
		VKRES_UNWRAP(ctx.GetStorage().Destroy(ctx.GetDevice(), m_index));
		VKRES_UNWRAP(allocator.Free(ctx, m_memory));
		*this = Buffer{};
		return {};
	}
};

// A buffer that exists on the device but has no memory bound yet. Must be consumed by Finalize or Destroy.
template <MemoryProperties M> class BufferPartial {
private:
	ResourceIndex<BufferRaw> m_index{};
	VkBuffer m_buffer{VK_NULL_HANDLE};
	VkDeviceSize m_size{0};
	VkMemoryRequirements m_requirements{};

public:
	inline BufferPartial() = default;
	inline BufferPartial(BufferPartial &&other) noexcept
	    : m_index{other.m_index}, m_buffer{std::exchange(other.m_buffer, VK_NULL_HANDLE)}, m_size{other.m_size},
	      m_requirements{other.m_requirements} {}
	inline BufferPartial &operator=(BufferPartial &&other) noexcept {
		assert(m_buffer == VK_NULL_HANDLE);
		m_index = other.m_index;
		m_buffer = std::exchange(other.m_buffer, VK_NULL_HANDLE);
		m_size = other.m_size;
		m_requirements = other.m_requirements;
		return *this;
	}
	BufferPartial(const BufferPartial &) = delete;
	BufferPartial &operator=(const BufferPartial &) = delete;
	inline ~BufferPartial() { assert(m_buffer == VK_NULL_HANDLE && "BufferPartial dropped without Finalize or Destroy"); }

	static inline ResourceResult<BufferPartial> Prepare(Context &ctx, VkDeviceSize size, VkBufferUsageFlags usage) {
		const Device &device = ctx.GetDevice();
		VkBufferCreateInfo create_info = {
		    .sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
		    .size = size,
		    .usage = usage,
		    .sharingMode = VK_SHARING_MODE_EXCLUSIVE,
		};
		VkBuffer buffer;
		VKRES_CHECK_VK(device.CreateBuffer(create_info, &buffer), "vkCreateBuffer");

		BufferPartial partial;
		partial.m_index = ctx.GetStorage().Insert(BufferRaw{.buffer = buffer, .size = size, .usage = usage});
		partial.m_buffer = buffer;
		partial.m_size = size;
		device.GetBufferMemoryRequirements(buffer, &partial.m_requirements);
		return partial;
	}

	inline VkBuffer GetHandle() const { return m_buffer; }
	inline VkDeviceSize GetSize() const { return m_size; }
	inline AllocReq<M> GetRequirement() const { return {m_requirements}; }
	inline std::vector<AllocReqRaw> Requirements() const { return {GetRequirement().GetRaw()}; }

	// Allocates and binds memory. The partial is consumed either way: on failure the buffer is destroyed.
	inline ResourceResult<Buffer<M>> Finalize(Context &ctx, Allocator &allocator) && {
		assert(m_buffer != VK_NULL_HANDLE);
		auto memory_result = allocator.Allocate(ctx, GetRequirement());
		if (memory_result.IsError()) {
			std::move(*this).Destroy(ctx);
			return memory_result.PopError();
		}
		MemoryChunk<M> memory = memory_result.PopValue();
		VkResult vk_result = ctx.GetDevice().BindBufferMemory(m_buffer, memory.GetHandle(), memory.GetRange().beg);
		if (vk_result != VK_SUCCESS) {
			std::move(*this).Destroy(ctx);
			VKRES_UNWRAP(allocator.Free(ctx, memory));
			return error::DeviceError{vk_result, "vkBindBufferMemory"};
		}
		Buffer<M> buffer{m_index, std::exchange(m_buffer, VK_NULL_HANDLE), m_size, memory};
		return buffer;
	}

	inline void Destroy(Context &ctx) && {
		if (m_buffer == VK_NULL_HANDLE)
			return;
		auto result = ctx.GetStorage().Destroy(ctx.GetDevice(), m_index);
		assert(result.IsOK());
		m_buffer = VK_NULL_HANDLE;
	}
};

// Host coherent buffer mapped for its whole lifetime
class PersistentBuffer {
private:
	Buffer<HostCoherent> m_buffer{};
	std::byte *m_mapped{nullptr};

public:
	inline PersistentBuffer() = default;
	inline PersistentBuffer(Buffer<HostCoherent> buffer, void *mapped)
	    : m_buffer{std::move(buffer)}, m_mapped{static_cast<std::byte *>(mapped)} {}

	inline VkBuffer GetHandle() const { return m_buffer.GetHandle(); }
	inline VkDeviceSize GetSize() const { return m_buffer.GetSize(); }
	inline const Buffer<HostCoherent> &GetBuffer() const { return m_buffer; }
	inline std::byte *GetMappedData() const { return m_mapped; }

	ResourceResult<void> Destroy(Context &ctx, Allocator &allocator);
};

class PersistentBufferPartial {
private:
	BufferPartial<HostCoherent> m_partial;

public:
	inline PersistentBufferPartial() = default;
	inline explicit PersistentBufferPartial(BufferPartial<HostCoherent> &&partial) : m_partial{std::move(partial)} {}

	static ResourceResult<PersistentBufferPartial> Prepare(Context &ctx, VkDeviceSize size, VkBufferUsageFlags usage);

	inline VkDeviceSize GetSize() const { return m_partial.GetSize(); }
	inline AllocReq<HostCoherent> GetRequirement() const { return m_partial.GetRequirement(); }
	inline std::vector<AllocReqRaw> Requirements() const { return m_partial.Requirements(); }

	// Binds memory, then maps the full range
	ResourceResult<PersistentBuffer> Finalize(Context &ctx, Allocator &allocator) &&;
	inline void Destroy(Context &ctx) && { std::move(m_partial).Destroy(ctx); }
};

} // namespace vkres

#endif
