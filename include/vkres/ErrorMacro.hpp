#pragma once
#ifndef VKRES_ERRORMACRO_HPP
#define VKRES_ERRORMACRO_HPP

#include "Error.hpp"

#include <cstdio>

#define VKRES_UNWRAP_ASSIGN(L_VALUE, RESULT) \
	do { \
		auto vkres_unwrap_result = RESULT; \
		if (vkres_unwrap_result.IsError()) \
			return vkres_unwrap_result.PopError(); \
		L_VALUE = vkres_unwrap_result.PopValue(); \
	} while (false)
#define VKRES_UNWRAP(RESULT) \
	do { \
		auto vkres_unwrap_result = RESULT; \
		if (vkres_unwrap_result.IsError()) \
			return vkres_unwrap_result.PopError(); \
	} while (false)
// Cleanup on a failure path: its own error is printed, so the caller can still return the original failure
#define VKRES_CLEANUP(RESULT) \
	do { \
		auto vkres_cleanup_result = RESULT; \
		if (vkres_cleanup_result.IsError()) \
			fprintf(stderr, "vkres: cleanup failed: %s\n", vkres_cleanup_result.GetError().Format().c_str()); \
	} while (false)
#define VKRES_CHECK_VK(CALL, NAME) \
	do { \
		VkResult vk_result = CALL; \
		if (vk_result != VK_SUCCESS) \
			return error::DeviceError{vk_result, NAME}; \
	} while (false)

#endif
