#pragma once
#ifndef VKRES_PAGEALLOCATOR_HPP
#define VKRES_PAGEALLOCATOR_HPP

#include "Allocator.hpp"

#include <map>
#include <vector>

namespace vkres {

struct PageAllocatorConfig {
	VkDeviceSize page_size{64u << 20u};
	// Empty pages kept per memory type instead of being returned to the device
	uint32_t retained_empty_pages{1};
};

// Pooled sub-allocation from page sized device memories. Each page keeps a sorted free list; allocation is first fit
// across the pages of the memory type, free coalesces with neighbours.
class PageAllocator final : public Allocator {
private:
	struct Page {
		ResourceIndex<MemoryRaw> index;
		VkDeviceMemory memory;
		VkDeviceSize size;
		std::vector<ByteRange> free_ranges;
		uint32_t chunk_count;

		std::optional<ByteRange> Alloc(VkDeviceSize alloc_size, VkDeviceSize alignment);
		void Free(const ByteRange &range);
	};
	PageAllocatorConfig m_config;
	std::map<uint32_t, std::vector<Page>> m_pages;

	void release_page(Context &ctx, const Page &page);

protected:
	AllocResult<MemoryChunkRaw> allocate(Context &ctx, const AllocReqRaw &req) final;
	AllocResult<void> free(Context &ctx, const MemoryChunkRaw &chunk) final;

public:
	inline explicit PageAllocator(const PageAllocatorConfig &config = {}) : m_config{config} {
		assert(m_config.page_size > 0);
	}
	inline PageAllocator(PageAllocator &&) noexcept = default;
	inline PageAllocator &operator=(PageAllocator &&) noexcept = default;
	inline ~PageAllocator() final { assert(m_pages.empty() && "PageAllocator dropped without Destroy"); }

	inline const PageAllocatorConfig &GetConfig() const { return m_config; }
	inline std::size_t GetPageCount(uint32_t memory_type) const {
		auto it = m_pages.find(memory_type);
		return it == m_pages.end() ? 0 : it->second.size();
	}

	void Destroy(Context &ctx) final;
};

} // namespace vkres

#endif
