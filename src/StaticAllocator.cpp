#include "vkres/StaticAllocator.hpp"

#include "vkres/ErrorMacro.hpp"

#include <cstdio>

namespace vkres {

AllocResult<void> StaticAllocatorConfig::AddAllocation(const Device &device, const AllocReqRaw &req) {
	uint32_t type_index;
	VKRES_UNWRAP_ASSIGN(type_index, GetMemoryTypeIndex(device, req));
	auto it = m_plans.try_emplace(type_index, Plan{ByteRange::Empty(), req.memory_class}).first;
	it->second.range.Extend(req.requirements.size, req.requirements.alignment);
	return {};
}

AllocResult<void> StaticAllocatorConfig::AddAllocations(const Device &device, std::span<const AllocReqRaw> reqs) {
	for (const auto &req : reqs)
		VKRES_UNWRAP(AddAllocation(device, req));
	return {};
}

AllocResult<StaticAllocator> StaticAllocator::Create(Context &ctx, const StaticAllocatorConfig &config) {
	StaticAllocator allocator;
	for (const auto &[type_index, plan] : config.GetPlans()) {
		VkDeviceSize size = plan.range.end;
		if (size == 0)
			continue;
		auto memory_result = create_memory(ctx, size, type_index, plan.memory_class);
		if (memory_result.IsError()) {
			allocator.release_pools(ctx);
			return memory_result.PopError();
		}
		auto index = memory_result.PopValue();
		const MemoryRaw *raw = ctx.GetStorage().Entry(index).GetValue();
		allocator.m_pools[type_index] = {
		    .index = index,
		    .memory = raw->memory,
		    .remaining = ByteRange::FromSize(size),
		    .chunk_count = 0,
		};
	}
	return allocator;
}

AllocResult<MemoryChunkRaw> StaticAllocator::allocate(Context &ctx, const AllocReqRaw &req) {
	uint32_t type_index;
	VKRES_UNWRAP_ASSIGN(type_index, GetMemoryTypeIndex(ctx.GetDevice(), req));

	auto it = m_pools.find(type_index);
	if (it == m_pools.end())
		return error::OutOfMemory{req.requirements.size, type_index, req.memory_class};
	Pool &pool = it->second;
	auto range = pool.remaining.Alloc(req.requirements.size, req.requirements.alignment);
	if (!range)
		return error::OutOfMemory{req.requirements.size, type_index, req.memory_class};
	++pool.chunk_count;
	return MemoryChunkRaw{pool.memory, *range, pool.index};
}

AllocResult<void> StaticAllocator::free(Context &, const MemoryChunkRaw &chunk) {
	for (auto &[type_index, pool] : m_pools) {
		if (pool.index == chunk.index && pool.chunk_count) {
			--pool.chunk_count;
			return {};
		}
	}
	return error::InvalidAllocation{"Memory"};
}

void StaticAllocator::release_pools(Context &ctx) {
	for (const auto &[type_index, pool] : m_pools) {
		auto result = destroy_memory(ctx, pool.index);
		if (result.IsError())
			fprintf(stderr, "vkres: %s\n", result.GetError().Format().c_str());
	}
	m_pools.clear();
}

void StaticAllocator::Destroy(Context &ctx) {
#ifndef NDEBUG
	for (const auto &[type_index, pool] : m_pools)
		assert(pool.chunk_count == 0 && "StaticAllocator destroyed with live allocations");
#endif
	release_pools(ctx);
}

} // namespace vkres
