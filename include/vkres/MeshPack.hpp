#pragma once
#ifndef VKRES_MESHPACK_HPP
#define VKRES_MESHPACK_HPP

#include "Buffer.hpp"
#include "Pack.hpp"
#include "StagingBuffer.hpp"

#include <algorithm>
#include <concepts>
#include <cstring>
#include <type_traits>
#include <vector>

namespace vkres {

template <typename V>
concept Vertex = std::is_trivially_copyable_v<V> && requires {
	{ V::GetAttributes() } -> std::convertible_to<std::vector<VkVertexInputAttributeDescription>>;
};

template <Vertex V> struct Mesh {
	std::vector<V> vertices;
	std::vector<uint32_t> indices;
};

struct MeshByteRange {
	ByteRange vertices, indices;

	inline bool operator==(const MeshByteRange &) const = default;
};

// Element ranges of one mesh inside its pack buffer
template <typename V> struct MeshRange {
	VkBuffer buffer;
	Range<V> vertices;
	Range<uint32_t> indices;
};

// Arguments for vkCmdBindVertexBuffers, vkCmdBindIndexBuffer and vkCmdDrawIndexed
struct MeshRangeBindData {
	VkBuffer buffer;
	VkDeviceSize vertex_offset, index_offset;
	uint32_t vertex_count, index_count;
};

// All meshes of a pack in one device local buffer: every vertex array first, then every index array
struct MeshPackData {
	Buffer<DeviceLocal> buffer;
	std::vector<MeshByteRange> meshes;

	inline std::size_t GetItemCount() const { return meshes.size(); }
	template <typename V> inline MeshRange<V> GetItem(std::size_t mesh) const {
		return {buffer.GetHandle(), Range<V>::FromByteRange(meshes[mesh].vertices),
		        Range<uint32_t>::FromByteRange(meshes[mesh].indices)};
	}
	template <typename V> inline MeshRangeBindData GetBindData(std::size_t mesh) const {
		const auto &range = meshes[mesh];
		return {
		    .buffer = buffer.GetHandle(),
		    .vertex_offset = range.vertices.beg,
		    .index_offset = range.indices.beg,
		    .vertex_count = static_cast<uint32_t>(range.vertices.Size() / sizeof(V)),
		    .index_count = static_cast<uint32_t>(range.indices.Size() / sizeof(uint32_t)),
		};
	}
	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) {
		meshes.clear();
		return buffer.Destroy(ctx, allocator);
	}
};

template <Vertex V> using MeshPack = Pack<V, MeshPackData>;
template <Vertex V> using MeshPackRef = PackRef<V, MeshPackData>;
template <Vertex V> using MeshHandle = Handle<V, MeshPackData>;
using MeshPackTypeErased = PackTypeErased<MeshPackData>;
using MeshPackTypeErasedList = PackTypeErasedList<MeshPackData>;

template <Vertex V> class MeshPackPartial;

template <Vertex V> struct MeshPackConfig {
	using Key = V;
	using Data = MeshPackData;
	using Partial = MeshPackPartial<V>;

	std::vector<Mesh<V>> meshes;

	inline bool IsEmpty() const { return meshes.empty(); }
};

template <Vertex V> class MeshPackPartial {
private:
	uint32_t m_index{0};
	BufferPartial<DeviceLocal> m_buffer;
	std::vector<MeshByteRange> m_meshes;
	std::vector<std::byte> m_contents;

public:
	inline MeshPackPartial() = default;

	static inline ResourceResult<MeshPackPartial> Prepare(Context &ctx, uint32_t index, const MeshPackConfig<V> &config) {
		if (config.meshes.empty())
			return error::InvalidConfiguration{"mesh pack without meshes"};

		MeshPackPartial partial;
		partial.m_index = index;

		StagingBufferBuilder builder;
		partial.m_meshes.resize(config.meshes.size());
		for (std::size_t i = 0; i < config.meshes.size(); ++i)
			partial.m_meshes[i].vertices = builder.Append<V>(config.meshes[i].vertices.size()).GetByteRange();
		for (std::size_t i = 0; i < config.meshes.size(); ++i)
			partial.m_meshes[i].indices = builder.Append<uint32_t>(config.meshes[i].indices.size()).GetByteRange();

		partial.m_contents.resize(builder.GetSize());
		for (std::size_t i = 0; i < config.meshes.size(); ++i) {
			const auto &mesh = config.meshes[i];
			const auto &range = partial.m_meshes[i];
			if (!mesh.vertices.empty())
				std::memcpy(partial.m_contents.data() + range.vertices.beg, mesh.vertices.data(), range.vertices.Size());
			if (!mesh.indices.empty())
				std::memcpy(partial.m_contents.data() + range.indices.beg, mesh.indices.data(), range.indices.Size());
		}

		VKRES_UNWRAP_ASSIGN(partial.m_buffer,
		                    BufferPartial<DeviceLocal>::Prepare(ctx, std::max<VkDeviceSize>(builder.GetSize(), 1),
		                                                        VK_BUFFER_USAGE_VERTEX_BUFFER_BIT |
		                                                            VK_BUFFER_USAGE_INDEX_BUFFER_BIT |
		                                                            VK_BUFFER_USAGE_TRANSFER_DST_BIT));
		return partial;
	}

	inline std::vector<AllocReqRaw> Requirements() const { return m_buffer.Requirements(); }

	// Binds the pack buffer and uploads every mesh through one staging buffer
	inline ResourceResult<MeshPack<V>> Finalize(Context &ctx, Allocator &allocator) && {
		MeshPackData data;
		VKRES_UNWRAP_ASSIGN(data.buffer, std::move(m_buffer).Finalize(ctx, allocator));
		data.meshes = std::move(m_meshes);

		auto upload_result = upload(ctx, data.buffer.GetHandle());
		if (upload_result.IsError()) {
			VKRES_CLEANUP(data.Destroy(ctx, allocator));
			return upload_result.PopError();
		}
		return MeshPack<V>{m_index, std::move(data)};
	}

	inline void Destroy(Context &ctx) && {
		std::move(m_buffer).Destroy(ctx);
		m_meshes.clear();
		m_contents.clear();
	}

private:
	inline ResourceResult<void> upload(Context &ctx, VkBuffer dst) {
		StagingBufferBuilder builder;
		ByteRange range = builder.AppendBytes(m_contents.size(), 1);
		StagingBuffer staging;
		VKRES_UNWRAP_ASSIGN(staging, builder.Build(ctx));
		staging.WriteBytes(range, m_contents.data());
		VkBufferCopy region = {.srcOffset = range.beg, .dstOffset = 0, .size = std::max<VkDeviceSize>(range.Size(), 1)};
		auto copy_result = staging.CopyToBuffer(ctx, dst, std::span<const VkBufferCopy>{&region, 1});
		m_contents.clear();
		if (copy_result.IsError()) {
			VKRES_CLEANUP(staging.Destroy(ctx));
			return copy_result;
		}
		return staging.Destroy(ctx);
	}
};

} // namespace vkres

#endif
