#include "vkres/StagingBuffer.hpp"

#include <algorithm>

namespace vkres {

ResourceResult<StagingBuffer> StagingBufferBuilder::Build(Context &ctx) const {
	StagingBuffer staging;
	PersistentBufferPartial partial;
	VKRES_UNWRAP_ASSIGN(partial, PersistentBufferPartial::Prepare(ctx, std::max<VkDeviceSize>(GetSize(), 1),
	                                                              VK_BUFFER_USAGE_TRANSFER_SRC_BIT));
	auto buffer_result = std::move(partial).Finalize(ctx, staging.m_allocator);
	if (buffer_result.IsError()) {
		staging.m_allocator.Destroy(ctx);
		return buffer_result.PopError();
	}
	staging.m_buffer = buffer_result.PopValue();
	return staging;
}

ResourceResult<void> StagingBuffer::CopyToBuffer(Context &ctx, VkBuffer dst,
                                                 std::span<const VkBufferCopy> regions) const {
	VKRES_CHECK_VK(ctx.GetDevice().CopyBuffer(m_buffer.GetHandle(), dst, regions), "CopyBuffer");
	return {};
}

ResourceResult<void> StagingBuffer::CopyToImage(Context &ctx, VkImage dst, const VkBufferImageCopy &region,
                                                VkImageLayout final_layout) const {
	VKRES_CHECK_VK(ctx.GetDevice().CopyBufferToImage(m_buffer.GetHandle(), dst, region, final_layout),
	               "CopyBufferToImage");
	return {};
}

ResourceResult<void> StagingBuffer::Destroy(Context &ctx) {
	auto result = m_buffer.Destroy(ctx, m_allocator);
	m_allocator.Destroy(ctx);
	return result;
}

} // namespace vkres
