#ifndef VKRES_INSTANCE_HPP
#define VKRES_INSTANCE_HPP

#include "Ptr.hpp"

#include <volk.h>

namespace vkres {
class Instance {
private:
	VkInstance m_instance{VK_NULL_HANDLE};
	VkDebugUtilsMessengerEXT m_debug_messenger{VK_NULL_HANDLE};

	static VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
	                                                     VkDebugUtilsMessageTypeFlagsEXT type,
	                                                     const VkDebugUtilsMessengerCallbackDataEXT *p_callback_data,
	                                                     void *p_user_data);

public:
	// Vulkan 1.3 instance, optionally with the validation layer and a messenger printing to stderr
	static Ptr<Instance> Create(const char *application_name, bool validation);

	VkInstance GetHandle() const { return m_instance; }

	~Instance();
};
} // namespace vkres

#endif
