#include "vkres/VmaBackedAllocator.hpp"

#include "vkres/ErrorMacro.hpp"

namespace vkres {

AllocResult<VmaAllocation> VmaBackedAllocator::find_allocation(const MemoryChunkRaw &chunk) const {
	auto it = m_allocations.find({chunk.memory, chunk.range.beg});
	if (it == m_allocations.end())
		return error::InvalidAllocation{"Memory"};
	return it->second;
}

AllocResult<MemoryChunkRaw> VmaBackedAllocator::allocate(Context &ctx, const AllocReqRaw &req) {
	uint32_t type_index;
	VKRES_UNWRAP_ASSIGN(type_index, GetMemoryTypeIndex(ctx.GetDevice(), req));

	VmaAllocationCreateInfo create_info = {
	    .requiredFlags = req.flags,
	    .memoryTypeBits = 1u << type_index,
	};
	VmaAllocation allocation;
	VmaAllocationInfo info;
	VkResult vk_result = vmaAllocateMemory(m_allocator, &req.requirements, &create_info, &allocation, &info);
	if (vk_result == VK_ERROR_OUT_OF_DEVICE_MEMORY || vk_result == VK_ERROR_OUT_OF_HOST_MEMORY)
		return error::OutOfMemory{req.requirements.size, type_index, req.memory_class};
	if (vk_result != VK_SUCCESS)
		return error::DeviceError{vk_result, "vmaAllocateMemory"};

	m_allocations[{info.deviceMemory, info.offset}] = allocation;
	return MemoryChunkRaw{info.deviceMemory, {info.offset, info.offset + req.requirements.size}, {}};
}

AllocResult<void> VmaBackedAllocator::free(Context &, const MemoryChunkRaw &chunk) {
	VmaAllocation allocation;
	VKRES_UNWRAP_ASSIGN(allocation, find_allocation(chunk));
	m_allocations.erase({chunk.memory, chunk.range.beg});
	vmaFreeMemory(m_allocator, allocation);
	return {};
}

AllocResult<void *> VmaBackedAllocator::map(Context &, const MemoryChunkRaw &chunk) {
	VmaAllocation allocation;
	VKRES_UNWRAP_ASSIGN(allocation, find_allocation(chunk));
	void *data;
	VKRES_CHECK_VK(vmaMapMemory(m_allocator, allocation, &data), "vmaMapMemory");
	return data;
}

AllocResult<void> VmaBackedAllocator::unmap(Context &, const MemoryChunkRaw &chunk) {
	VmaAllocation allocation;
	VKRES_UNWRAP_ASSIGN(allocation, find_allocation(chunk));
	vmaUnmapMemory(m_allocator, allocation);
	return {};
}

void VmaBackedAllocator::Destroy(Context &) {
	assert(m_allocations.empty() && "VmaBackedAllocator destroyed with live allocations");
	for (const auto &[key, allocation] : m_allocations)
		vmaFreeMemory(m_allocator, allocation);
	m_allocations.clear();
}

} // namespace vkres
