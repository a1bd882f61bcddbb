#pragma once
#ifndef VKRES_UNIFORMBUFFER_HPP
#define VKRES_UNIFORMBUFFER_HPP

#include "Buffer.hpp"

#include <cstring>
#include <type_traits>

namespace vkres {

// Persistent buffer holding an array of uniform blocks, each starting at a minUniformBufferOffsetAlignment boundary
class UniformBufferBase {
protected:
	PersistentBuffer m_buffer{};
	VkDeviceSize m_element_size{0}, m_stride{0};
	uint32_t m_count{0};

public:
	inline UniformBufferBase() = default;
	inline UniformBufferBase(PersistentBuffer buffer, VkDeviceSize element_size, VkDeviceSize stride, uint32_t count)
	    : m_buffer{std::move(buffer)}, m_element_size{element_size}, m_stride{stride}, m_count{count} {}

	inline VkBuffer GetHandle() const { return m_buffer.GetHandle(); }
	inline VkDeviceSize GetStride() const { return m_stride; }
	inline uint32_t GetCount() const { return m_count; }
	inline VkDescriptorBufferInfo GetDescriptorInfo(uint32_t index) const {
		assert(index < m_count);
		return {m_buffer.GetHandle(), index * m_stride, m_element_size};
	}
	inline void WriteBytes(uint32_t index, const void *data) {
		assert(index < m_count);
		std::memcpy(m_buffer.GetMappedData() + index * m_stride, data, m_element_size);
	}

	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) { return m_buffer.Destroy(ctx, allocator); }
};

template <typename T> class UniformBuffer : public UniformBufferBase {
	static_assert(std::is_trivially_copyable_v<T>);

public:
	using UniformBufferBase::UniformBufferBase;

	inline void Write(uint32_t index, const T &value) { WriteBytes(index, &value); }
};

template <typename T> class UniformBufferPartial {
private:
	PersistentBufferPartial m_partial;
	VkDeviceSize m_stride{0};
	uint32_t m_count{0};

public:
	inline UniformBufferPartial() = default;

	static inline ResourceResult<UniformBufferPartial> Prepare(Context &ctx, uint32_t count) {
		assert(count > 0);
		UniformBufferPartial partial;
		partial.m_stride = AlignUp(sizeof(T), ctx.GetDevice().GetLimits().minUniformBufferOffsetAlignment);
		partial.m_count = count;
		VKRES_UNWRAP_ASSIGN(partial.m_partial, PersistentBufferPartial::Prepare(ctx, partial.m_stride * count,
		                                                                        VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT));
		return partial;
	}

	inline VkDeviceSize GetStride() const { return m_stride; }
	inline uint32_t GetCount() const { return m_count; }
	inline std::vector<AllocReqRaw> Requirements() const { return m_partial.Requirements(); }

	inline ResourceResult<UniformBuffer<T>> Finalize(Context &ctx, Allocator &allocator) && {
		PersistentBuffer buffer;
		VKRES_UNWRAP_ASSIGN(buffer, std::move(m_partial).Finalize(ctx, allocator));
		return UniformBuffer<T>{std::move(buffer), sizeof(T), m_stride, m_count};
	}
	inline void Destroy(Context &ctx) && { std::move(m_partial).Destroy(ctx); }
};

} // namespace vkres

#endif
