#include "vkres/Instance.hpp"

#include <cstdio>
#include <vector>

namespace vkres {
Ptr<Instance> Instance::Create(const char *application_name, bool validation) {
	if (vkCreateInstance == nullptr) {
		if (volkInitialize() != VK_SUCCESS)
			return nullptr;
	}
	VkApplicationInfo app_info = {
	    .sType = VK_STRUCTURE_TYPE_APPLICATION_INFO,
	    .pApplicationName = application_name,
	    .applicationVersion = VK_MAKE_VERSION(1, 0, 0),
	    .pEngineName = "vkres",
	    .engineVersion = VK_MAKE_VERSION(1, 0, 0),
	    .apiVersion = VK_API_VERSION_1_3,
	};
	std::vector<const char *> layers, extensions;
	if (validation) {
		layers.push_back("VK_LAYER_KHRONOS_validation");
		extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
	}
	VkInstanceCreateInfo create_info = {
	    .sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
	    .pApplicationInfo = &app_info,
	    .enabledLayerCount = (uint32_t)layers.size(),
	    .ppEnabledLayerNames = layers.data(),
	    .enabledExtensionCount = (uint32_t)extensions.size(),
	    .ppEnabledExtensionNames = extensions.data(),
	};
	auto ret = std::make_shared<Instance>();
	if (vkCreateInstance(&create_info, nullptr, &ret->m_instance) != VK_SUCCESS)
		return nullptr;
	volkLoadInstanceOnly(ret->m_instance);

	if (validation) {
		VkDebugUtilsMessengerCreateInfoEXT messenger_info = {
		    .sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT,
		    .messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
		                       VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT,
		    .messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
		                   VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
		                   VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT,
		    .pfnUserCallback = debug_callback,
		};
		if (vkCreateDebugUtilsMessengerEXT(ret->m_instance, &messenger_info, nullptr, &ret->m_debug_messenger) !=
		    VK_SUCCESS)
			fprintf(stderr, "vkres: failed to create debug messenger\n");
	}
	return ret;
}

VKAPI_ATTR VkBool32 VKAPI_CALL Instance::debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                                        VkDebugUtilsMessageTypeFlagsEXT,
                                                        const VkDebugUtilsMessengerCallbackDataEXT *p_callback_data,
                                                        void *) {
	fprintf(stderr, "[%s] %s\n", severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT ? "ERROR" : "WARNING",
	        p_callback_data->pMessage);
	return VK_FALSE;
}

Instance::~Instance() {
	if (m_instance) {
		if (m_debug_messenger)
			vkDestroyDebugUtilsMessengerEXT(m_instance, m_debug_messenger, nullptr);
		vkDestroyInstance(m_instance, nullptr);
	}
}
} // namespace vkres
