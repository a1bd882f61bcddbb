#ifndef VKRES_VULKAN_DEVICE_HPP
#define VKRES_VULKAN_DEVICE_HPP

#include "Device.hpp"
#include "PhysicalDevice.hpp"

#include "vk_mem_alloc.h"

#include <string>

namespace vkres {

struct VulkanDeviceCreateInfo {
	std::string application_name{"vkres"};
	bool validation{false};
	uint32_t physical_device_index{0};
};

// Device backed by volk, with one generic queue used for the blocking uploads
class VulkanDevice final : public Device {
private:
	Ptr<PhysicalDevice> m_physical_device_ptr;

	VkDevice m_device{VK_NULL_HANDLE};
	uint32_t m_queue_family{0};
	VkQueue m_queue{VK_NULL_HANDLE};
	VkCommandPool m_command_pool{VK_NULL_HANDLE};
	VkFence m_fence{VK_NULL_HANDLE};
	VmaAllocator m_allocator{VK_NULL_HANDLE};

	VkResult create_device();
	VkResult create_allocator();
	VkResult create_command_objects();

	template <typename RecordFunc> VkResult submit_blocking(RecordFunc &&record) const;

public:
	static Ptr<VulkanDevice> Create(const Ptr<PhysicalDevice> &physical_device);
	static Ptr<VulkanDevice> Create(const VulkanDeviceCreateInfo &create_info);

	VmaAllocator GetAllocatorHandle() const { return m_allocator; }
	const Ptr<PhysicalDevice> &GetPhysicalDevicePtr() const { return m_physical_device_ptr; }
	VkDevice GetHandle() const { return m_device; }
	VkQueue GetQueueHandle() const { return m_queue; }
	uint32_t GetQueueFamily() const { return m_queue_family; }

	const VkPhysicalDeviceMemoryProperties &GetMemoryProperties() const final;
	const VkPhysicalDeviceLimits &GetLimits() const final;

	VkResult AllocateMemory(const VkMemoryAllocateInfo &info, VkDeviceMemory *p_memory) const final;
	void FreeMemory(VkDeviceMemory memory) const final;
	VkResult MapMemory(VkDeviceMemory memory, VkDeviceSize offset, VkDeviceSize size, void **pp_data) const final;
	void UnmapMemory(VkDeviceMemory memory) const final;

	VkResult CreateBuffer(const VkBufferCreateInfo &info, VkBuffer *p_buffer) const final;
	void DestroyBuffer(VkBuffer buffer) const final;
	void GetBufferMemoryRequirements(VkBuffer buffer, VkMemoryRequirements *p_requirements) const final;
	VkResult BindBufferMemory(VkBuffer buffer, VkDeviceMemory memory, VkDeviceSize offset) const final;

	VkResult CreateImage(const VkImageCreateInfo &info, VkImage *p_image) const final;
	void DestroyImage(VkImage image) const final;
	void GetImageMemoryRequirements(VkImage image, VkMemoryRequirements *p_requirements) const final;
	VkResult BindImageMemory(VkImage image, VkDeviceMemory memory, VkDeviceSize offset) const final;

	VkResult CreateImageView(const VkImageViewCreateInfo &info, VkImageView *p_view) const final;
	void DestroyImageView(VkImageView view) const final;
	VkResult CreateSampler(const VkSamplerCreateInfo &info, VkSampler *p_sampler) const final;
	void DestroySampler(VkSampler sampler) const final;

	VkResult CreateShaderModule(const VkShaderModuleCreateInfo &info, VkShaderModule *p_module) const final;
	void DestroyShaderModule(VkShaderModule module) const final;

	VkResult CreateDescriptorSetLayout(const VkDescriptorSetLayoutCreateInfo &info,
	                                   VkDescriptorSetLayout *p_layout) const final;
	void DestroyDescriptorSetLayout(VkDescriptorSetLayout layout) const final;
	VkResult CreateDescriptorPool(const VkDescriptorPoolCreateInfo &info, VkDescriptorPool *p_pool) const final;
	void DestroyDescriptorPool(VkDescriptorPool pool) const final;
	VkResult AllocateDescriptorSets(const VkDescriptorSetAllocateInfo &info, VkDescriptorSet *p_sets) const final;
	void UpdateDescriptorSets(std::span<const VkWriteDescriptorSet> writes) const final;

	VkResult CreatePipelineLayout(const VkPipelineLayoutCreateInfo &info, VkPipelineLayout *p_layout) const final;
	void DestroyPipelineLayout(VkPipelineLayout layout) const final;
	VkResult CreateGraphicsPipeline(const VkGraphicsPipelineCreateInfo &info, VkPipeline *p_pipeline) const final;
	void DestroyPipeline(VkPipeline pipeline) const final;

	VkResult CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions) const final;
	VkResult CopyBufferToImage(VkBuffer src, VkImage dst, const VkBufferImageCopy &region,
	                           VkImageLayout final_layout) const final;

	VkResult WaitIdle() const final;

	~VulkanDevice() final;
};

} // namespace vkres

#endif
