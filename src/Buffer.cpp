#include "vkres/Buffer.hpp"

namespace vkres {

ResourceResult<void> PersistentBuffer::Destroy(Context &ctx, Allocator &allocator) {
	if (m_buffer.IsNull())
		return {};
	VKRES_UNWRAP(allocator.Unmap(ctx, m_buffer.GetMemory()));
	m_mapped = nullptr;
	return m_buffer.Destroy(ctx, allocator);
}

ResourceResult<PersistentBufferPartial> PersistentBufferPartial::Prepare(Context &ctx, VkDeviceSize size,
                                                                         VkBufferUsageFlags usage) {
	auto partial_result = BufferPartial<HostCoherent>::Prepare(ctx, size, usage);
	if (partial_result.IsError())
		return partial_result.PopError();
	return PersistentBufferPartial{partial_result.PopValue()};
}

ResourceResult<PersistentBuffer> PersistentBufferPartial::Finalize(Context &ctx, Allocator &allocator) && {
	Buffer<HostCoherent> buffer;
	VKRES_UNWRAP_ASSIGN(buffer, std::move(m_partial).Finalize(ctx, allocator));
	auto map_result = allocator.Map(ctx, buffer.GetMemory());
	if (map_result.IsError()) {
		VKRES_CLEANUP(buffer.Destroy(ctx, allocator));
		return map_result.PopError();
	}
	return PersistentBuffer{buffer, map_result.PopValue()};
}

} // namespace vkres
