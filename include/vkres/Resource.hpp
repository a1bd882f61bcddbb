#pragma once
#ifndef VKRES_RESOURCE_HPP
#define VKRES_RESOURCE_HPP

#include "Device.hpp"

namespace vkres {

// Raw device objects as stored in the arena. Each knows how to tear itself down.

struct MemoryRaw {
	inline static constexpr const char *kName = "Memory";

	VkDeviceMemory memory{VK_NULL_HANDLE};
	VkDeviceSize size{0};
	uint32_t type_index{0};
	void *mapped{nullptr};
	uint32_t map_count{0};

	inline void Destroy(const Device &device) const {
		if (map_count)
			device.UnmapMemory(memory);
		device.FreeMemory(memory);
	}
};

struct BufferRaw {
	inline static constexpr const char *kName = "Buffer";

	VkBuffer buffer{VK_NULL_HANDLE};
	VkDeviceSize size{0};
	VkBufferUsageFlags usage{0};

	inline void Destroy(const Device &device) const { device.DestroyBuffer(buffer); }
};

struct ImageRaw {
	inline static constexpr const char *kName = "Image";

	VkImage image{VK_NULL_HANDLE};
	VkExtent3D extent{};
	VkFormat format{VK_FORMAT_UNDEFINED};

	inline void Destroy(const Device &device) const { device.DestroyImage(image); }
};

struct ImageViewRaw {
	inline static constexpr const char *kName = "ImageView";

	VkImageView view{VK_NULL_HANDLE};
	VkImage image{VK_NULL_HANDLE};

	inline void Destroy(const Device &device) const { device.DestroyImageView(view); }
};

} // namespace vkres

#endif
