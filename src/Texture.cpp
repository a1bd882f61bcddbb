#include "vkres/Texture.hpp"

#include "vkres/ErrorMacro.hpp"
#include "vkres/StagingBuffer.hpp"

#include <cassert>
#include <cstdio>

namespace vkres {

uint32_t GetFormatTexelSize(VkFormat format) {
	switch (format) {
	case VK_FORMAT_R8_UNORM:
	case VK_FORMAT_R8_SRGB:
		return 1;
	case VK_FORMAT_R8G8_UNORM:
	case VK_FORMAT_R8G8_SRGB:
	case VK_FORMAT_R16_SFLOAT:
		return 2;
	case VK_FORMAT_R8G8B8A8_UNORM:
	case VK_FORMAT_R8G8B8A8_SRGB:
	case VK_FORMAT_B8G8R8A8_UNORM:
	case VK_FORMAT_B8G8R8A8_SRGB:
	case VK_FORMAT_R16G16_SFLOAT:
	case VK_FORMAT_R32_SFLOAT:
		return 4;
	case VK_FORMAT_R16G16B16A16_SFLOAT:
	case VK_FORMAT_R32G32_SFLOAT:
		return 8;
	case VK_FORMAT_R32G32B32A32_SFLOAT:
		return 16;
	default:
		return 0;
	}
}

ResourceResult<void> Texture::Destroy(Context &ctx, Allocator &allocator) {
	if (IsNull())
		return {};
	const Device &device = ctx.GetDevice();
	if (m_sampler != VK_NULL_HANDLE)
		device.DestroySampler(m_sampler);
	if (!m_view_index.IsNull())
		VKRES_UNWRAP(ctx.GetStorage().Destroy(device, m_view_index));
	VKRES_UNWRAP(ctx.GetStorage().Destroy(device, m_image_index));
	VKRES_UNWRAP(allocator.Free(ctx, m_memory));
	*this = Texture{};
	return {};
}

ResourceResult<TexturePartial> TexturePartial::Prepare(Context &ctx, ImageData data) {
	if (data.width == 0 || data.height == 0)
		return error::InvalidConfiguration{"texture with an empty extent"};
	uint32_t texel_size = GetFormatTexelSize(data.format);
	if (texel_size == 0)
		return error::InvalidConfiguration{"unsupported texture format"};
	if (data.pixels.size() != VkDeviceSize{data.width} * data.height * texel_size)
		return error::InvalidConfiguration{"texture pixels do not cover its extent"};

	VkImageCreateInfo create_info = {
	    .sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
	    .imageType = VK_IMAGE_TYPE_2D,
	    .format = data.format,
	    .extent = {data.width, data.height, 1},
	    .mipLevels = 1,
	    .arrayLayers = 1,
	    .samples = VK_SAMPLE_COUNT_1_BIT,
	    .tiling = VK_IMAGE_TILING_OPTIMAL,
	    .usage = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
	    .sharingMode = VK_SHARING_MODE_EXCLUSIVE,
	    .initialLayout = VK_IMAGE_LAYOUT_UNDEFINED,
	};
	VkImage image;
	VKRES_CHECK_VK(ctx.GetDevice().CreateImage(create_info, &image), "vkCreateImage");

	TexturePartial partial;
	partial.m_index = ctx.GetStorage().Insert(ImageRaw{.image = image, .extent = create_info.extent, .format = data.format});
	partial.m_image = image;
	ctx.GetDevice().GetImageMemoryRequirements(image, &partial.m_requirements);
	partial.m_data = std::move(data);
	return partial;
}

ResourceResult<Texture> TexturePartial::Finalize(Context &ctx, Allocator &allocator) && {
	assert(m_image != VK_NULL_HANDLE);
	const Device &device = ctx.GetDevice();

	Texture texture;
	texture.m_image_index = m_index;
	texture.m_image = m_image;
	{
		auto memory_result = allocator.Allocate(ctx, GetRequirement());
		if (memory_result.IsError()) {
			std::move(*this).Destroy(ctx);
			return memory_result.PopError();
		}
		texture.m_memory = memory_result.PopValue();
	}
	// From here on the image belongs to texture, so failures unwind through Texture::Destroy
	m_image = VK_NULL_HANDLE;
	auto fail = [&](ResourceError error) -> ResourceResult<Texture> {
		VKRES_CLEANUP(texture.Destroy(ctx, allocator));
		return error;
	};

	VkResult vk_result =
	    device.BindImageMemory(texture.m_image, texture.m_memory.GetHandle(), texture.m_memory.GetRange().beg);
	if (vk_result != VK_SUCCESS)
		return fail(error::DeviceError{vk_result, "vkBindImageMemory"});

	{
		StagingBufferBuilder builder;
		ByteRange pixel_range = builder.AppendBytes(m_data.pixels.size(), 1);
		auto staging_result = builder.Build(ctx);
		if (staging_result.IsError())
			return fail(staging_result.PopError());
		StagingBuffer staging = staging_result.PopValue();
		staging.WriteBytes(pixel_range, m_data.pixels.data());
		VkBufferImageCopy region = {
		    .bufferOffset = pixel_range.beg,
		    .imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1},
		    .imageExtent = {m_data.width, m_data.height, 1},
		};
		auto copy_result = staging.CopyToImage(ctx, texture.m_image, region, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
		auto destroy_result = staging.Destroy(ctx);
		if (copy_result.IsError())
			return fail(copy_result.PopError());
		if (destroy_result.IsError())
			return fail(destroy_result.PopError());
	}

	VkImageViewCreateInfo view_info = {
	    .sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
	    .image = texture.m_image,
	    .viewType = VK_IMAGE_VIEW_TYPE_2D,
	    .format = m_data.format,
	    .subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1},
	};
	vk_result = device.CreateImageView(view_info, &texture.m_view);
	if (vk_result != VK_SUCCESS) {
		texture.m_view = VK_NULL_HANDLE;
		return fail(error::DeviceError{vk_result, "vkCreateImageView"});
	}
	texture.m_view_index = ctx.GetStorage().Insert(ImageViewRaw{.view = texture.m_view, .image = texture.m_image});

	VkSamplerCreateInfo sampler_info = {
	    .sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO,
	    .magFilter = VK_FILTER_LINEAR,
	    .minFilter = VK_FILTER_LINEAR,
	    .mipmapMode = VK_SAMPLER_MIPMAP_MODE_LINEAR,
	    .addressModeU = VK_SAMPLER_ADDRESS_MODE_REPEAT,
	    .addressModeV = VK_SAMPLER_ADDRESS_MODE_REPEAT,
	    .addressModeW = VK_SAMPLER_ADDRESS_MODE_REPEAT,
	    .maxLod = 1.0f,
	};
	vk_result = device.CreateSampler(sampler_info, &texture.m_sampler);
	if (vk_result != VK_SUCCESS) {
		texture.m_sampler = VK_NULL_HANDLE;
		return fail(error::DeviceError{vk_result, "vkCreateSampler"});
	}
	m_data = {};
	return texture;
}

void TexturePartial::Destroy(Context &ctx) && {
	if (m_image == VK_NULL_HANDLE)
		return;
	auto result = ctx.GetStorage().Destroy(ctx.GetDevice(), m_index);
	if (!result.IsOK())
		fprintf(stderr, "vkres: %s\n", result.GetError().Format().c_str());
	assert(result.IsOK());
	m_image = VK_NULL_HANDLE;
	m_data = {};
}

} // namespace vkres
