#pragma once
#ifndef VKRES_DEVICE_HPP
#define VKRES_DEVICE_HPP

#include "Ptr.hpp"

#include <volk.h>

#include <span>

namespace vkres {

// The primitive create/destroy surface every resource in this library is built on. VulkanDevice forwards to volk,
// unit tests substitute a recording implementation.
class Device {
public:
	virtual ~Device() = default;

	virtual const VkPhysicalDeviceMemoryProperties &GetMemoryProperties() const = 0;
	virtual const VkPhysicalDeviceLimits &GetLimits() const = 0;

	virtual VkResult AllocateMemory(const VkMemoryAllocateInfo &info, VkDeviceMemory *p_memory) const = 0;
	virtual void FreeMemory(VkDeviceMemory memory) const = 0;
	virtual VkResult MapMemory(VkDeviceMemory memory, VkDeviceSize offset, VkDeviceSize size, void **pp_data) const = 0;
	virtual void UnmapMemory(VkDeviceMemory memory) const = 0;

	virtual VkResult CreateBuffer(const VkBufferCreateInfo &info, VkBuffer *p_buffer) const = 0;
	virtual void DestroyBuffer(VkBuffer buffer) const = 0;
	virtual void GetBufferMemoryRequirements(VkBuffer buffer, VkMemoryRequirements *p_requirements) const = 0;
	virtual VkResult BindBufferMemory(VkBuffer buffer, VkDeviceMemory memory, VkDeviceSize offset) const = 0;

	virtual VkResult CreateImage(const VkImageCreateInfo &info, VkImage *p_image) const = 0;
	virtual void DestroyImage(VkImage image) const = 0;
	virtual void GetImageMemoryRequirements(VkImage image, VkMemoryRequirements *p_requirements) const = 0;
	virtual VkResult BindImageMemory(VkImage image, VkDeviceMemory memory, VkDeviceSize offset) const = 0;

	virtual VkResult CreateImageView(const VkImageViewCreateInfo &info, VkImageView *p_view) const = 0;
	virtual void DestroyImageView(VkImageView view) const = 0;
	virtual VkResult CreateSampler(const VkSamplerCreateInfo &info, VkSampler *p_sampler) const = 0;
	virtual void DestroySampler(VkSampler sampler) const = 0;

	virtual VkResult CreateShaderModule(const VkShaderModuleCreateInfo &info, VkShaderModule *p_module) const = 0;
	virtual void DestroyShaderModule(VkShaderModule module) const = 0;

	virtual VkResult CreateDescriptorSetLayout(const VkDescriptorSetLayoutCreateInfo &info,
	                                           VkDescriptorSetLayout *p_layout) const = 0;
	virtual void DestroyDescriptorSetLayout(VkDescriptorSetLayout layout) const = 0;
	virtual VkResult CreateDescriptorPool(const VkDescriptorPoolCreateInfo &info, VkDescriptorPool *p_pool) const = 0;
	virtual void DestroyDescriptorPool(VkDescriptorPool pool) const = 0;
	virtual VkResult AllocateDescriptorSets(const VkDescriptorSetAllocateInfo &info, VkDescriptorSet *p_sets) const = 0;
	virtual void UpdateDescriptorSets(std::span<const VkWriteDescriptorSet> writes) const = 0;

	virtual VkResult CreatePipelineLayout(const VkPipelineLayoutCreateInfo &info, VkPipelineLayout *p_layout) const = 0;
	virtual void DestroyPipelineLayout(VkPipelineLayout layout) const = 0;
	virtual VkResult CreateGraphicsPipeline(const VkGraphicsPipelineCreateInfo &info, VkPipeline *p_pipeline) const = 0;
	virtual void DestroyPipeline(VkPipeline pipeline) const = 0;

	// Blocking transfers: record, submit and wait before returning
	virtual VkResult CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions) const = 0;
	// Transitions dst from UNDEFINED to TRANSFER_DST, copies, then transitions to final_layout
	virtual VkResult CopyBufferToImage(VkBuffer src, VkImage dst, const VkBufferImageCopy &region,
	                                   VkImageLayout final_layout) const = 0;

	virtual VkResult WaitIdle() const = 0;
};

} // namespace vkres

#endif
