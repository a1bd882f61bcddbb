#ifndef VKRES_PHYSICAL_DEVICE_HPP
#define VKRES_PHYSICAL_DEVICE_HPP

#include "Instance.hpp"

#include <optional>
#include <vector>

namespace vkres {
class PhysicalDevice {
private:
	Ptr<Instance> m_instance_ptr;

	VkPhysicalDevice m_physical_device{VK_NULL_HANDLE};

	VkPhysicalDeviceMemoryProperties m_memory_properties;
	VkPhysicalDeviceFeatures m_features;
	VkPhysicalDeviceVulkan13Features m_vk13_features{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES};
	VkPhysicalDeviceProperties m_properties;
	std::vector<VkQueueFamilyProperties> m_queue_family_properties;

	void initialize(const Ptr<Instance> &instance, VkPhysicalDevice physical_device);

public:
	static std::vector<Ptr<PhysicalDevice>> Fetch(const Ptr<Instance> &instance);

	const Ptr<Instance> &GetInstancePtr() const { return m_instance_ptr; }
	VkPhysicalDevice GetHandle() const { return m_physical_device; }
	const VkPhysicalDeviceMemoryProperties &GetMemoryProperties() const { return m_memory_properties; }
	const VkPhysicalDeviceProperties &GetProperties() const { return m_properties; }
	const VkPhysicalDeviceFeatures &GetFeatures() const { return m_features; }
	const VkPhysicalDeviceVulkan13Features &GetVk13Features() const { return m_vk13_features; }
	const std::vector<VkQueueFamilyProperties> &GetQueueFamilyProperties() const { return m_queue_family_properties; }

	// First family supporting graphics, compute and transfer
	std::optional<uint32_t> FindGenericQueueFamily() const;
};
} // namespace vkres

#endif
