#pragma once
#ifndef VKRES_TEXTURE_HPP
#define VKRES_TEXTURE_HPP

#include "Allocator.hpp"

#include <cstddef>
#include <vector>

namespace vkres {

// Tightly packed 2D pixels
struct ImageData {
	uint32_t width{0}, height{0};
	VkFormat format{VK_FORMAT_R8G8B8A8_UNORM};
	std::vector<std::byte> pixels;
};

// Bytes per texel of an uncompressed color format, 0 for formats textures cannot be created with
uint32_t GetFormatTexelSize(VkFormat format);

// Sampled device local image with its view and sampler
class Texture {
private:
	ResourceIndex<ImageRaw> m_image_index{};
	ResourceIndex<ImageViewRaw> m_view_index{};
	VkImage m_image{VK_NULL_HANDLE};
	VkImageView m_view{VK_NULL_HANDLE};
	VkSampler m_sampler{VK_NULL_HANDLE};
	MemoryChunk<DeviceLocal> m_memory{};

	friend class TexturePartial;

public:
	inline VkImage GetImageHandle() const { return m_image; }
	inline VkImageView GetViewHandle() const { return m_view; }
	inline VkSampler GetSamplerHandle() const { return m_sampler; }
	inline const MemoryChunk<DeviceLocal> &GetMemory() const { return m_memory; }
	inline bool IsNull() const { return m_image == VK_NULL_HANDLE; }
	inline VkDescriptorImageInfo GetDescriptorInfo() const {
		return {m_sampler, m_view, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL};
	}

	// Sampler, view, image, then memory
	ResourceResult<void> Destroy(Context &ctx, Allocator &allocator);
};

class TexturePartial {
private:
	ResourceIndex<ImageRaw> m_index{};
	VkImage m_image{VK_NULL_HANDLE};
	VkMemoryRequirements m_requirements{};
	ImageData m_data;

public:
	inline TexturePartial() = default;
	inline TexturePartial(TexturePartial &&other) noexcept
	    : m_index{other.m_index}, m_image{std::exchange(other.m_image, VK_NULL_HANDLE)},
	      m_requirements{other.m_requirements}, m_data{std::move(other.m_data)} {}
	inline TexturePartial &operator=(TexturePartial &&other) noexcept {
		assert(m_image == VK_NULL_HANDLE);
		m_index = other.m_index;
		m_image = std::exchange(other.m_image, VK_NULL_HANDLE);
		m_requirements = other.m_requirements;
		m_data = std::move(other.m_data);
		return *this;
	}
	TexturePartial(const TexturePartial &) = delete;
	TexturePartial &operator=(const TexturePartial &) = delete;
	inline ~TexturePartial() { assert(m_image == VK_NULL_HANDLE && "TexturePartial dropped without Finalize or Destroy"); }

	static ResourceResult<TexturePartial> Prepare(Context &ctx, ImageData data);

	inline VkImage GetHandle() const { return m_image; }
	inline AllocReq<DeviceLocal> GetRequirement() const { return {m_requirements}; }
	inline std::vector<AllocReqRaw> Requirements() const { return {GetRequirement().GetRaw()}; }

	// Binds memory, uploads the pixels through a staging buffer, then creates the view and sampler
	ResourceResult<Texture> Finalize(Context &ctx, Allocator &allocator) &&;
	void Destroy(Context &ctx) &&;
};

} // namespace vkres

#endif
