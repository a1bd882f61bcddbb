#pragma once
#ifndef VKRES_ALLOCATOR_HPP
#define VKRES_ALLOCATOR_HPP

#include "ByteRange.hpp"
#include "Error.hpp"
#include "MemoryProperties.hpp"
#include "ResourceStorage.hpp"

#include <optional>
#include <span>

namespace vkres {

// Untyped allocation request
struct AllocReqRaw {
	VkMemoryRequirements requirements{};
	VkMemoryPropertyFlags flags{0};
	const char *memory_class{""};
};

template <MemoryProperties M> struct AllocReq {
	VkMemoryRequirements requirements{};

	inline AllocReqRaw GetRaw() const { return {requirements, M::kFlags, M::kName}; }
};

// First memory type index in memory_type_bits whose property flags contain flags
std::optional<uint32_t> GetMemoryTypeIndex(const VkPhysicalDeviceMemoryProperties &properties,
                                           uint32_t memory_type_bits, VkMemoryPropertyFlags flags);
AllocResult<uint32_t> GetMemoryTypeIndex(const Device &device, const AllocReqRaw &req);

struct MemoryChunkRaw {
	VkDeviceMemory memory{VK_NULL_HANDLE};
	ByteRange range{};
	// Arena entry of the backing memory, null when the allocator does not keep memory in the arena
	ResourceIndex<MemoryRaw> index{};

	inline bool IsEmpty() const { return memory == VK_NULL_HANDLE; }
};

// A sub-region of device memory that satisfies classification M
template <MemoryProperties M> class MemoryChunk {
private:
	MemoryChunkRaw m_raw{};

public:
	inline MemoryChunk() = default;
	inline explicit MemoryChunk(const MemoryChunkRaw &raw) : m_raw{raw} {}

	inline static MemoryChunk Empty() { return {}; }
	inline bool IsEmpty() const { return m_raw.IsEmpty(); }
	inline VkDeviceMemory GetHandle() const { return m_raw.memory; }
	inline const ByteRange &GetRange() const { return m_raw.range; }
	inline const MemoryChunkRaw &GetRaw() const { return m_raw; }
};

class Allocator {
protected:
	// Allocates a device memory and records it in the arena
	static AllocResult<ResourceIndex<MemoryRaw>> create_memory(Context &ctx, VkDeviceSize size, uint32_t type_index,
	                                                           const char *memory_class);
	static AllocResult<void> destroy_memory(Context &ctx, const ResourceIndex<MemoryRaw> &index);
	// Reference counted whole-memory mapping
	static AllocResult<void *> map_memory(Context &ctx, const ResourceIndex<MemoryRaw> &index);
	static AllocResult<void> unmap_memory(Context &ctx, const ResourceIndex<MemoryRaw> &index);

	virtual AllocResult<MemoryChunkRaw> allocate(Context &ctx, const AllocReqRaw &req) = 0;
	virtual AllocResult<void> free(Context &ctx, const MemoryChunkRaw &chunk) = 0;
	virtual AllocResult<void *> map(Context &ctx, const MemoryChunkRaw &chunk);
	virtual AllocResult<void> unmap(Context &ctx, const MemoryChunkRaw &chunk);

public:
	inline Allocator() = default;
	inline Allocator(Allocator &&) noexcept = default;
	inline Allocator &operator=(Allocator &&) noexcept = default;
	virtual ~Allocator() = default;

	template <MemoryProperties M> inline AllocResult<MemoryChunk<M>> Allocate(Context &ctx, const AllocReq<M> &req) {
		auto result = allocate(ctx, req.GetRaw());
		if (result.IsError())
			return result.PopError();
		return MemoryChunk<M>{result.PopValue()};
	}
	// Frees the chunk and resets it to empty; an empty chunk is left alone
	template <MemoryProperties M> inline AllocResult<void> Free(Context &ctx, MemoryChunk<M> &chunk) {
		if (chunk.IsEmpty())
			return {};
		auto result = free(ctx, chunk.GetRaw());
		if (result.IsError()) {
			if (result.GetError().template Is<error::InvalidAllocation>())
				return error::InvalidAllocation{M::kName};
			return result.PopError();
		}
		chunk = MemoryChunk<M>::Empty();
		return {};
	}
	// Returns a host pointer to the start of the chunk
	template <HostVisibleMemory M> inline AllocResult<void *> Map(Context &ctx, const MemoryChunk<M> &chunk) {
		return map(ctx, chunk.GetRaw());
	}
	template <HostVisibleMemory M> inline AllocResult<void> Unmap(Context &ctx, const MemoryChunk<M> &chunk) {
		return unmap(ctx, chunk.GetRaw());
	}

	// Releases every device memory this allocator created. Chunks still live at this point are a leak.
	virtual void Destroy(Context &ctx) = 0;
};

} // namespace vkres

#endif
