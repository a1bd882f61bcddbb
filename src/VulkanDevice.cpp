#include "vkres/VulkanDevice.hpp"

#include <cstdio>

namespace vkres {

Ptr<VulkanDevice> VulkanDevice::Create(const Ptr<PhysicalDevice> &physical_device) {
	auto ret = std::make_shared<VulkanDevice>();
	ret->m_physical_device_ptr = physical_device;

	auto queue_family = physical_device->FindGenericQueueFamily();
	if (!queue_family)
		return nullptr;
	ret->m_queue_family = *queue_family;

	if (ret->create_device() != VK_SUCCESS)
		return nullptr;
	vkGetDeviceQueue(ret->m_device, ret->m_queue_family, 0, &ret->m_queue);
	if (ret->create_allocator() != VK_SUCCESS)
		return nullptr;
	if (ret->create_command_objects() != VK_SUCCESS)
		return nullptr;
	return ret;
}

Ptr<VulkanDevice> VulkanDevice::Create(const VulkanDeviceCreateInfo &create_info) {
	auto instance = Instance::Create(create_info.application_name.c_str(), create_info.validation);
	if (!instance) {
		fprintf(stderr, "vkres: failed to create Vulkan instance\n");
		return nullptr;
	}
	auto physical_devices = PhysicalDevice::Fetch(instance);
	if (create_info.physical_device_index >= physical_devices.size()) {
		fprintf(stderr, "vkres: physical device %u not found (%zu available)\n", create_info.physical_device_index,
		        physical_devices.size());
		return nullptr;
	}
	return Create(physical_devices[create_info.physical_device_index]);
}

VkResult VulkanDevice::create_device() {
	float priority = 1.0f;
	VkDeviceQueueCreateInfo queue_info = {
	    .sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
	    .queueFamilyIndex = m_queue_family,
	    .queueCount = 1,
	    .pQueuePriorities = &priority,
	};
	VkPhysicalDeviceVulkan13Features vk13_features = {
	    .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES,
	    .dynamicRendering = m_physical_device_ptr->GetVk13Features().dynamicRendering,
	};
	VkDeviceCreateInfo create_info = {
	    .sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
	    .pNext = &vk13_features,
	    .queueCreateInfoCount = 1,
	    .pQueueCreateInfos = &queue_info,
	};
	VkResult result = vkCreateDevice(m_physical_device_ptr->GetHandle(), &create_info, nullptr, &m_device);
	if (result != VK_SUCCESS)
		return result;
	volkLoadDevice(m_device);
	return VK_SUCCESS;
}

VkResult VulkanDevice::create_allocator() {
	VmaVulkanFunctions vk_funcs = {
	    .vkGetInstanceProcAddr = vkGetInstanceProcAddr,
	    .vkGetDeviceProcAddr = vkGetDeviceProcAddr,
	};
	VmaAllocatorCreateInfo create_info = {
	    .physicalDevice = m_physical_device_ptr->GetHandle(),
	    .device = m_device,
	    .pVulkanFunctions = &vk_funcs,
	    .instance = m_physical_device_ptr->GetInstancePtr()->GetHandle(),
	    .vulkanApiVersion = VK_API_VERSION_1_3,
	};
	return vmaCreateAllocator(&create_info, &m_allocator);
}

VkResult VulkanDevice::create_command_objects() {
	VkCommandPoolCreateInfo pool_info = {
	    .sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
	    .flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT,
	    .queueFamilyIndex = m_queue_family,
	};
	if (VkResult result = vkCreateCommandPool(m_device, &pool_info, nullptr, &m_command_pool); result != VK_SUCCESS)
		return result;
	VkFenceCreateInfo fence_info = {.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
	return vkCreateFence(m_device, &fence_info, nullptr, &m_fence);
}

template <typename RecordFunc> VkResult VulkanDevice::submit_blocking(RecordFunc &&record) const {
	VkCommandBufferAllocateInfo alloc_info = {
	    .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
	    .commandPool = m_command_pool,
	    .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY,
	    .commandBufferCount = 1,
	};
	VkCommandBuffer command_buffer;
	if (VkResult result = vkAllocateCommandBuffers(m_device, &alloc_info, &command_buffer); result != VK_SUCCESS)
		return result;

	VkCommandBufferBeginInfo begin_info = {
	    .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
	    .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
	};
	VkResult result = vkBeginCommandBuffer(command_buffer, &begin_info);
	if (result == VK_SUCCESS) {
		record(command_buffer);
		result = vkEndCommandBuffer(command_buffer);
	}
	if (result == VK_SUCCESS) {
		VkSubmitInfo submit_info = {
		    .sType = VK_STRUCTURE_TYPE_SUBMIT_INFO,
		    .commandBufferCount = 1,
		    .pCommandBuffers = &command_buffer,
		};
		result = vkQueueSubmit(m_queue, 1, &submit_info, m_fence);
	}
	if (result == VK_SUCCESS) {
		result = vkWaitForFences(m_device, 1, &m_fence, VK_TRUE, UINT64_MAX);
		vkResetFences(m_device, 1, &m_fence);
	}
	vkFreeCommandBuffers(m_device, m_command_pool, 1, &command_buffer);
	return result;
}

const VkPhysicalDeviceMemoryProperties &VulkanDevice::GetMemoryProperties() const {
	return m_physical_device_ptr->GetMemoryProperties();
}
const VkPhysicalDeviceLimits &VulkanDevice::GetLimits() const {
	return m_physical_device_ptr->GetProperties().limits;
}

VkResult VulkanDevice::AllocateMemory(const VkMemoryAllocateInfo &info, VkDeviceMemory *p_memory) const {
	return vkAllocateMemory(m_device, &info, nullptr, p_memory);
}
void VulkanDevice::FreeMemory(VkDeviceMemory memory) const { vkFreeMemory(m_device, memory, nullptr); }
VkResult VulkanDevice::MapMemory(VkDeviceMemory memory, VkDeviceSize offset, VkDeviceSize size, void **pp_data) const {
	return vkMapMemory(m_device, memory, offset, size, 0, pp_data);
}
void VulkanDevice::UnmapMemory(VkDeviceMemory memory) const { vkUnmapMemory(m_device, memory); }

VkResult VulkanDevice::CreateBuffer(const VkBufferCreateInfo &info, VkBuffer *p_buffer) const {
	return vkCreateBuffer(m_device, &info, nullptr, p_buffer);
}
void VulkanDevice::DestroyBuffer(VkBuffer buffer) const { vkDestroyBuffer(m_device, buffer, nullptr); }
void VulkanDevice::GetBufferMemoryRequirements(VkBuffer buffer, VkMemoryRequirements *p_requirements) const {
	vkGetBufferMemoryRequirements(m_device, buffer, p_requirements);
}
VkResult VulkanDevice::BindBufferMemory(VkBuffer buffer, VkDeviceMemory memory, VkDeviceSize offset) const {
	return vkBindBufferMemory(m_device, buffer, memory, offset);
}

VkResult VulkanDevice::CreateImage(const VkImageCreateInfo &info, VkImage *p_image) const {
	return vkCreateImage(m_device, &info, nullptr, p_image);
}
void VulkanDevice::DestroyImage(VkImage image) const { vkDestroyImage(m_device, image, nullptr); }
void VulkanDevice::GetImageMemoryRequirements(VkImage image, VkMemoryRequirements *p_requirements) const {
	vkGetImageMemoryRequirements(m_device, image, p_requirements);
}
VkResult VulkanDevice::BindImageMemory(VkImage image, VkDeviceMemory memory, VkDeviceSize offset) const {
	return vkBindImageMemory(m_device, image, memory, offset);
}

VkResult VulkanDevice::CreateImageView(const VkImageViewCreateInfo &info, VkImageView *p_view) const {
	return vkCreateImageView(m_device, &info, nullptr, p_view);
}
void VulkanDevice::DestroyImageView(VkImageView view) const { vkDestroyImageView(m_device, view, nullptr); }
VkResult VulkanDevice::CreateSampler(const VkSamplerCreateInfo &info, VkSampler *p_sampler) const {
	return vkCreateSampler(m_device, &info, nullptr, p_sampler);
}
void VulkanDevice::DestroySampler(VkSampler sampler) const { vkDestroySampler(m_device, sampler, nullptr); }

VkResult VulkanDevice::CreateShaderModule(const VkShaderModuleCreateInfo &info, VkShaderModule *p_module) const {
	return vkCreateShaderModule(m_device, &info, nullptr, p_module);
}
void VulkanDevice::DestroyShaderModule(VkShaderModule module) const { vkDestroyShaderModule(m_device, module, nullptr); }

VkResult VulkanDevice::CreateDescriptorSetLayout(const VkDescriptorSetLayoutCreateInfo &info,
                                                 VkDescriptorSetLayout *p_layout) const {
	return vkCreateDescriptorSetLayout(m_device, &info, nullptr, p_layout);
}
void VulkanDevice::DestroyDescriptorSetLayout(VkDescriptorSetLayout layout) const {
	vkDestroyDescriptorSetLayout(m_device, layout, nullptr);
}
VkResult VulkanDevice::CreateDescriptorPool(const VkDescriptorPoolCreateInfo &info, VkDescriptorPool *p_pool) const {
	return vkCreateDescriptorPool(m_device, &info, nullptr, p_pool);
}
void VulkanDevice::DestroyDescriptorPool(VkDescriptorPool pool) const {
	vkDestroyDescriptorPool(m_device, pool, nullptr);
}
VkResult VulkanDevice::AllocateDescriptorSets(const VkDescriptorSetAllocateInfo &info, VkDescriptorSet *p_sets) const {
	return vkAllocateDescriptorSets(m_device, &info, p_sets);
}
void VulkanDevice::UpdateDescriptorSets(std::span<const VkWriteDescriptorSet> writes) const {
	vkUpdateDescriptorSets(m_device, (uint32_t)writes.size(), writes.data(), 0, nullptr);
}

VkResult VulkanDevice::CreatePipelineLayout(const VkPipelineLayoutCreateInfo &info, VkPipelineLayout *p_layout) const {
	return vkCreatePipelineLayout(m_device, &info, nullptr, p_layout);
}
void VulkanDevice::DestroyPipelineLayout(VkPipelineLayout layout) const {
	vkDestroyPipelineLayout(m_device, layout, nullptr);
}
VkResult VulkanDevice::CreateGraphicsPipeline(const VkGraphicsPipelineCreateInfo &info, VkPipeline *p_pipeline) const {
	return vkCreateGraphicsPipelines(m_device, VK_NULL_HANDLE, 1, &info, nullptr, p_pipeline);
}
void VulkanDevice::DestroyPipeline(VkPipeline pipeline) const { vkDestroyPipeline(m_device, pipeline, nullptr); }

VkResult VulkanDevice::CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions) const {
	return submit_blocking([&](VkCommandBuffer command_buffer) {
		vkCmdCopyBuffer(command_buffer, src, dst, (uint32_t)regions.size(), regions.data());
	});
}

VkResult VulkanDevice::CopyBufferToImage(VkBuffer src, VkImage dst, const VkBufferImageCopy &region,
                                         VkImageLayout final_layout) const {
	VkImageSubresourceRange range = {
	    .aspectMask = region.imageSubresource.aspectMask,
	    .baseMipLevel = region.imageSubresource.mipLevel,
	    .levelCount = 1,
	    .baseArrayLayer = region.imageSubresource.baseArrayLayer,
	    .layerCount = region.imageSubresource.layerCount,
	};
	return submit_blocking([&](VkCommandBuffer command_buffer) {
		VkImageMemoryBarrier barrier = {
		    .sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER,
		    .srcAccessMask = 0,
		    .dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT,
		    .oldLayout = VK_IMAGE_LAYOUT_UNDEFINED,
		    .newLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
		    .srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED,
		    .dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED,
		    .image = dst,
		    .subresourceRange = range,
		};
		vkCmdPipelineBarrier(command_buffer, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT, 0, 0,
		                     nullptr, 0, nullptr, 1, &barrier);
		vkCmdCopyBufferToImage(command_buffer, src, dst, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
		barrier.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
		barrier.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
		barrier.oldLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
		barrier.newLayout = final_layout;
		vkCmdPipelineBarrier(command_buffer, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT, 0, 0,
		                     nullptr, 0, nullptr, 1, &barrier);
	});
}

VkResult VulkanDevice::WaitIdle() const { return vkDeviceWaitIdle(m_device); }

VulkanDevice::~VulkanDevice() {
	if (m_device == VK_NULL_HANDLE)
		return;
	vkDeviceWaitIdle(m_device);
	if (m_fence)
		vkDestroyFence(m_device, m_fence, nullptr);
	if (m_command_pool)
		vkDestroyCommandPool(m_device, m_command_pool, nullptr);
	if (m_allocator)
		vmaDestroyAllocator(m_allocator);
	vkDestroyDevice(m_device, nullptr);
}

} // namespace vkres
