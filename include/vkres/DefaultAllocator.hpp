#pragma once
#ifndef VKRES_DEFAULTALLOCATOR_HPP
#define VKRES_DEFAULTALLOCATOR_HPP

#include "Allocator.hpp"

#include <vector>

namespace vkres {

// One device memory per request, released by Free
class DefaultAllocator final : public Allocator {
private:
	std::vector<ResourceIndex<MemoryRaw>> m_memories;

protected:
	AllocResult<MemoryChunkRaw> allocate(Context &ctx, const AllocReqRaw &req) final;
	AllocResult<void> free(Context &ctx, const MemoryChunkRaw &chunk) final;

public:
	inline DefaultAllocator() = default;
	inline DefaultAllocator(DefaultAllocator &&) noexcept = default;
	inline DefaultAllocator &operator=(DefaultAllocator &&) noexcept = default;
	inline ~DefaultAllocator() final { assert(m_memories.empty() && "DefaultAllocator dropped without Destroy"); }

	inline std::size_t GetAllocationCount() const { return m_memories.size(); }

	void Destroy(Context &ctx) final;
};

} // namespace vkres

#endif
