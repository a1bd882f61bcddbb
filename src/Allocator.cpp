#include "vkres/Allocator.hpp"

#include "vkres/ErrorMacro.hpp"

namespace vkres {

std::optional<uint32_t> GetMemoryTypeIndex(const VkPhysicalDeviceMemoryProperties &properties,
                                           uint32_t memory_type_bits, VkMemoryPropertyFlags flags) {
	for (uint32_t i = 0; i < properties.memoryTypeCount; ++i) {
		if ((memory_type_bits & (1u << i)) && (properties.memoryTypes[i].propertyFlags & flags) == flags)
			return i;
	}
	return std::nullopt;
}

AllocResult<uint32_t> GetMemoryTypeIndex(const Device &device, const AllocReqRaw &req) {
	auto index = GetMemoryTypeIndex(device.GetMemoryProperties(), req.requirements.memoryTypeBits, req.flags);
	if (!index)
		return error::UnsupportedMemoryType{req.requirements.memoryTypeBits, req.memory_class};
	return *index;
}

AllocResult<ResourceIndex<MemoryRaw>> Allocator::create_memory(Context &ctx, VkDeviceSize size, uint32_t type_index,
                                                               const char *memory_class) {
	VkMemoryAllocateInfo info = {
	    .sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO,
	    .allocationSize = size,
	    .memoryTypeIndex = type_index,
	};
	VkDeviceMemory memory;
	VkResult vk_result = ctx.GetDevice().AllocateMemory(info, &memory);
	if (vk_result == VK_ERROR_OUT_OF_DEVICE_MEMORY || vk_result == VK_ERROR_OUT_OF_HOST_MEMORY)
		return error::OutOfMemory{size, type_index, memory_class};
	if (vk_result != VK_SUCCESS)
		return error::DeviceError{vk_result, "vkAllocateMemory"};
	return ctx.GetStorage().Insert(MemoryRaw{.memory = memory, .size = size, .type_index = type_index});
}

AllocResult<void> Allocator::destroy_memory(Context &ctx, const ResourceIndex<MemoryRaw> &index) {
	VKRES_UNWRAP(ctx.GetStorage().Destroy(ctx.GetDevice(), index));
	return {};
}

AllocResult<void *> Allocator::map_memory(Context &ctx, const ResourceIndex<MemoryRaw> &index) {
	MemoryRaw *raw;
	VKRES_UNWRAP_ASSIGN(raw, ctx.GetStorage().EntryMut(index));
	if (raw->map_count == 0)
		VKRES_CHECK_VK(ctx.GetDevice().MapMemory(raw->memory, 0, VK_WHOLE_SIZE, &raw->mapped), "vkMapMemory");
	++raw->map_count;
	return raw->mapped;
}

AllocResult<void> Allocator::unmap_memory(Context &ctx, const ResourceIndex<MemoryRaw> &index) {
	MemoryRaw *raw;
	VKRES_UNWRAP_ASSIGN(raw, ctx.GetStorage().EntryMut(index));
	assert(raw->map_count > 0 && "Unmap without a matching Map");
	if (raw->map_count == 0)
		return {};
	if (--raw->map_count == 0) {
		ctx.GetDevice().UnmapMemory(raw->memory);
		raw->mapped = nullptr;
	}
	return {};
}

AllocResult<void *> Allocator::map(Context &ctx, const MemoryChunkRaw &chunk) {
	void *base;
	VKRES_UNWRAP_ASSIGN(base, map_memory(ctx, chunk.index));
	return static_cast<void *>(static_cast<std::byte *>(base) + chunk.range.beg);
}

AllocResult<void> Allocator::unmap(Context &ctx, const MemoryChunkRaw &chunk) { return unmap_memory(ctx, chunk.index); }

} // namespace vkres
