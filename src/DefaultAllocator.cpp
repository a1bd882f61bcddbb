#include "vkres/DefaultAllocator.hpp"

#include "vkres/ErrorMacro.hpp"

#include <algorithm>
#include <cstdio>

namespace vkres {

AllocResult<MemoryChunkRaw> DefaultAllocator::allocate(Context &ctx, const AllocReqRaw &req) {
	uint32_t type_index;
	VKRES_UNWRAP_ASSIGN(type_index, GetMemoryTypeIndex(ctx.GetDevice(), req));

	ResourceIndex<MemoryRaw> index;
	VKRES_UNWRAP_ASSIGN(index, create_memory(ctx, req.requirements.size, type_index, req.memory_class));
	m_memories.push_back(index);

	const MemoryRaw *raw;
	VKRES_UNWRAP_ASSIGN(raw, ctx.GetStorage().Entry(index));
	return MemoryChunkRaw{raw->memory, ByteRange::FromSize(req.requirements.size), index};
}

AllocResult<void> DefaultAllocator::free(Context &ctx, const MemoryChunkRaw &chunk) {
	auto it = std::find(m_memories.begin(), m_memories.end(), chunk.index);
	if (it == m_memories.end())
		return error::InvalidAllocation{"Memory"};
	m_memories.erase(it);
	return destroy_memory(ctx, chunk.index);
}

void DefaultAllocator::Destroy(Context &ctx) {
	assert(m_memories.empty() && "DefaultAllocator destroyed with live allocations");
	for (const auto &index : m_memories) {
		auto result = destroy_memory(ctx, index);
		if (result.IsError())
			fprintf(stderr, "vkres: %s\n", result.GetError().Format().c_str());
	}
	m_memories.clear();
}

} // namespace vkres
