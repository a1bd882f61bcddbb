#pragma once
#ifndef VKRES_MEMORYPROPERTIES_HPP
#define VKRES_MEMORYPROPERTIES_HPP

#include <volk.h>

#include <concepts>

namespace vkres {

struct HostVisible {
	static constexpr VkMemoryPropertyFlags kFlags = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT;
	static constexpr const char *kName = "HostVisible";
	static constexpr bool kMappable = true;
};
struct HostCoherent {
	static constexpr VkMemoryPropertyFlags kFlags =
	    VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
	static constexpr const char *kName = "HostCoherent";
	static constexpr bool kMappable = true;
};
struct DeviceLocal {
	static constexpr VkMemoryPropertyFlags kFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
	static constexpr const char *kName = "DeviceLocal";
	static constexpr bool kMappable = false;
};

template <typename M>
concept MemoryProperties = requires {
	{ M::kFlags } -> std::convertible_to<VkMemoryPropertyFlags>;
	{ M::kName } -> std::convertible_to<const char *>;
	{ M::kMappable } -> std::convertible_to<bool>;
};

template <typename M>
concept HostVisibleMemory = MemoryProperties<M> && M::kMappable;

} // namespace vkres

#endif
