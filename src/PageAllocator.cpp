#include "vkres/PageAllocator.hpp"

#include "vkres/ErrorMacro.hpp"

#include <algorithm>
#include <cstdio>

namespace vkres {

std::optional<ByteRange> PageAllocator::Page::Alloc(VkDeviceSize alloc_size, VkDeviceSize alignment) {
	for (auto it = free_ranges.begin(); it != free_ranges.end(); ++it) {
		ByteRange remaining = *it;
		auto range = remaining.Alloc(alloc_size, alignment);
		if (!range)
			continue;
		ByteRange front{it->beg, range->beg}, back = remaining;
		it = free_ranges.erase(it);
		if (!back.IsEmpty())
			it = free_ranges.insert(it, back);
		if (!front.IsEmpty())
			free_ranges.insert(it, front);
		++chunk_count;
		return range;
	}
	return std::nullopt;
}

void PageAllocator::Page::Free(const ByteRange &range) {
	auto it = std::lower_bound(free_ranges.begin(), free_ranges.end(), range,
	                           [](const ByteRange &l, const ByteRange &r) { return l.beg < r.beg; });
	assert(it == free_ranges.end() || !it->Overlaps(range));
	it = free_ranges.insert(it, range);
	// Merge with the following range
	if (auto next = it + 1; next != free_ranges.end() && next->beg == it->end) {
		it->end = next->end;
		free_ranges.erase(next);
	}
	// Merge with the preceding range
	if (it != free_ranges.begin()) {
		auto prev = it - 1;
		if (prev->end == it->beg) {
			prev->end = it->end;
			free_ranges.erase(it);
		}
	}
	--chunk_count;
}

AllocResult<MemoryChunkRaw> PageAllocator::allocate(Context &ctx, const AllocReqRaw &req) {
	uint32_t type_index;
	VKRES_UNWRAP_ASSIGN(type_index, GetMemoryTypeIndex(ctx.GetDevice(), req));

	auto &pages = m_pages[type_index];
	for (auto &page : pages) {
		if (auto range = page.Alloc(req.requirements.size, req.requirements.alignment))
			return MemoryChunkRaw{page.memory, *range, page.index};
	}

	// No page has room, open a new one large enough for the request
	VkDeviceSize page_size = DivCeil(std::max<VkDeviceSize>(req.requirements.size, 1), m_config.page_size) *
	                         m_config.page_size;
	auto memory_result = create_memory(ctx, page_size, type_index, req.memory_class);
	if (memory_result.IsError()) {
		if (pages.empty())
			m_pages.erase(type_index);
		return memory_result.PopError();
	}
	auto index = memory_result.PopValue();
	Page &page = pages.emplace_back(Page{
	    .index = index,
	    .memory = ctx.GetStorage().Entry(index).GetValue()->memory,
	    .size = page_size,
	    .free_ranges = {ByteRange::FromSize(page_size)},
	    .chunk_count = 0,
	});
	auto range = page.Alloc(req.requirements.size, req.requirements.alignment);
	assert(range);
	return MemoryChunkRaw{page.memory, *range, page.index};
}

AllocResult<void> PageAllocator::free(Context &ctx, const MemoryChunkRaw &chunk) {
	for (auto &[type_index, pages] : m_pages) {
		auto it = std::find_if(pages.begin(), pages.end(), [&chunk](const Page &page) { return page.index == chunk.index; });
		if (it == pages.end())
			continue;
		if (!ByteRange::FromSize(it->size).Contains(chunk.range) || it->chunk_count == 0)
			return error::InvalidAllocation{"Memory"};
		it->Free(chunk.range);
		if (it->chunk_count == 0) {
			auto empty_count = (uint32_t)std::count_if(pages.begin(), pages.end(),
			                                           [](const Page &page) { return page.chunk_count == 0; });
			if (empty_count > m_config.retained_empty_pages) {
				Page page = std::move(*it);
				pages.erase(it);
				if (pages.empty()) {
					uint32_t key = type_index;
					m_pages.erase(key);
				}
				release_page(ctx, page);
			}
		}
		return {};
	}
	return error::InvalidAllocation{"Memory"};
}

void PageAllocator::release_page(Context &ctx, const Page &page) {
	auto result = destroy_memory(ctx, page.index);
	if (result.IsError())
		fprintf(stderr, "vkres: %s\n", result.GetError().Format().c_str());
}

void PageAllocator::Destroy(Context &ctx) {
	for (const auto &[type_index, pages] : m_pages)
		for (const auto &page : pages) {
			assert(page.chunk_count == 0 && "PageAllocator destroyed with live allocations");
			release_page(ctx, page);
		}
	m_pages.clear();
}

} // namespace vkres
