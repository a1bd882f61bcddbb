#pragma once
#ifndef VKRES_STATICALLOCATOR_HPP
#define VKRES_STATICALLOCATOR_HPP

#include "Allocator.hpp"

#include <map>

namespace vkres {

// The allocation plan of a StaticAllocator: every request it will serve, laid out per memory type
class StaticAllocatorConfig {
public:
	struct Plan {
		ByteRange range;
		const char *memory_class;
	};

private:
	std::map<uint32_t, Plan> m_plans;

public:
	AllocResult<void> AddAllocation(const Device &device, const AllocReqRaw &req);
	template <MemoryProperties M> inline AllocResult<void> AddAllocation(const Device &device, const AllocReq<M> &req) {
		return AddAllocation(device, req.GetRaw());
	}
	AllocResult<void> AddAllocations(const Device &device, std::span<const AllocReqRaw> reqs);

	inline const std::map<uint32_t, Plan> &GetPlans() const { return m_plans; }
	inline VkDeviceSize GetSize(uint32_t memory_type) const {
		auto it = m_plans.find(memory_type);
		return it == m_plans.end() ? 0 : it->second.range.Size();
	}
};

// One device memory per planned memory type, bump-allocated front to back. Free only drops the chunk count; the
// memory lives until Destroy. Requests served in planned order (or any in-order subset of it) always fit.
class StaticAllocator final : public Allocator {
private:
	struct Pool {
		ResourceIndex<MemoryRaw> index;
		VkDeviceMemory memory;
		ByteRange remaining;
		uint32_t chunk_count;
	};
	std::map<uint32_t, Pool> m_pools;

	void release_pools(Context &ctx);

protected:
	AllocResult<MemoryChunkRaw> allocate(Context &ctx, const AllocReqRaw &req) final;
	AllocResult<void> free(Context &ctx, const MemoryChunkRaw &chunk) final;

public:
	static AllocResult<StaticAllocator> Create(Context &ctx, const StaticAllocatorConfig &config);

	inline StaticAllocator() = default;
	inline StaticAllocator(StaticAllocator &&) noexcept = default;
	inline StaticAllocator &operator=(StaticAllocator &&) noexcept = default;
	inline ~StaticAllocator() final { assert(m_pools.empty() && "StaticAllocator dropped without Destroy"); }

	inline std::size_t GetPoolCount() const { return m_pools.size(); }
	inline VkDeviceSize GetRemaining(uint32_t memory_type) const {
		auto it = m_pools.find(memory_type);
		return it == m_pools.end() ? 0 : it->second.remaining.Size();
	}

	void Destroy(Context &ctx) final;
};

} // namespace vkres

#endif
