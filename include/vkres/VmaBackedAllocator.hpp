#pragma once
#ifndef VKRES_VMABACKEDALLOCATOR_HPP
#define VKRES_VMABACKEDALLOCATOR_HPP

#include "Allocator.hpp"

#include "vk_mem_alloc.h"

#include <map>
#include <utility>

namespace vkres {

// Delegates to a VmaAllocator, usually VulkanDevice::GetAllocatorHandle(). Chunks do not live in the arena.
class VmaBackedAllocator final : public Allocator {
private:
	VmaAllocator m_allocator{VK_NULL_HANDLE};
	std::map<std::pair<VkDeviceMemory, VkDeviceSize>, VmaAllocation> m_allocations;

	AllocResult<VmaAllocation> find_allocation(const MemoryChunkRaw &chunk) const;

protected:
	AllocResult<MemoryChunkRaw> allocate(Context &ctx, const AllocReqRaw &req) final;
	AllocResult<void> free(Context &ctx, const MemoryChunkRaw &chunk) final;
	AllocResult<void *> map(Context &ctx, const MemoryChunkRaw &chunk) final;
	AllocResult<void> unmap(Context &ctx, const MemoryChunkRaw &chunk) final;

public:
	inline explicit VmaBackedAllocator(VmaAllocator allocator) : m_allocator{allocator} {}
	inline VmaBackedAllocator(VmaBackedAllocator &&) noexcept = default;
	inline VmaBackedAllocator &operator=(VmaBackedAllocator &&) noexcept = default;
	inline ~VmaBackedAllocator() final {
		assert(m_allocations.empty() && "VmaBackedAllocator dropped without Destroy");
	}

	inline VmaAllocator GetAllocatorHandle() const { return m_allocator; }
	inline std::size_t GetAllocationCount() const { return m_allocations.size(); }

	void Destroy(Context &ctx) final;
};

} // namespace vkres

#endif
