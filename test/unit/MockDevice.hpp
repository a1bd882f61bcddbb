#pragma once
#ifndef VKRES_TEST_MOCKDEVICE_HPP
#define VKRES_TEST_MOCKDEVICE_HPP

#include <vkres/Device.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <vector>

// Device that hands out fake handles, records every call, and backs each memory with host bytes so uploads can be
// checked
class MockDevice final : public vkres::Device {
public:
	struct Binding {
		VkDeviceMemory memory{VK_NULL_HANDLE};
		VkDeviceSize offset{0};
	};

	mutable std::vector<std::string> log;
	// Double destroys and operations on unknown handles
	mutable std::vector<std::string> errors;
	mutable std::size_t update_count{0};
	mutable uint32_t last_set_layout_count{0};

	VkDeviceSize buffer_alignment{256}, image_alignment{1024};
	uint32_t buffer_memory_type_bits{~0u}, image_memory_type_bits{~0u};

private:
	VkPhysicalDeviceMemoryProperties m_memory_properties{};
	VkPhysicalDeviceLimits m_limits{};

	mutable uint64_t m_counter{0};
	mutable std::map<uint64_t, std::string> m_live;
	mutable std::map<std::string, int> m_failures;
	mutable std::map<uint64_t, std::vector<std::byte>> m_memories;
	mutable std::map<uint64_t, VkDeviceSize> m_buffer_sizes;
	mutable std::map<uint64_t, Binding> m_buffer_bindings;
	mutable std::map<uint64_t, VkMemoryRequirements> m_image_requirements;

	template <typename T> inline static uint64_t raw(T handle) { return (uint64_t)(uintptr_t)handle; }

	template <typename T> inline T create(const char *kind) const {
		uint64_t id = ++m_counter;
		m_live[id] = kind;
		return (T)(uintptr_t)id;
	}
	// Written to the output of a failed create, like a driver leaving it undefined
	template <typename T> inline static T poison() { return (T)(uintptr_t)0xdeadull; }
	template <typename T> inline void destroy(T handle, const char *call) const {
		log.emplace_back(call);
		if (handle == VK_NULL_HANDLE)
			return;
		if (!m_live.erase(raw(handle)))
			errors.push_back(std::string{call} + " on unknown handle " + std::to_string(raw(handle)));
	}
	inline VkResult check(const char *call) const {
		log.emplace_back(call);
		auto it = m_failures.find(call);
		if (it == m_failures.end())
			return VK_SUCCESS;
		if (it->second > 0) {
			--it->second;
			return VK_SUCCESS;
		}
		m_failures.erase(it);
		return std::string{call} == "AllocateMemory" ? VK_ERROR_OUT_OF_DEVICE_MEMORY : VK_ERROR_INITIALIZATION_FAILED;
	}

public:
	inline explicit MockDevice(std::vector<VkMemoryPropertyFlags> memory_types = {
	                               VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
	                               VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT}) {
		m_memory_properties.memoryTypeCount = memory_types.size();
		for (uint32_t i = 0; i < memory_types.size(); ++i)
			m_memory_properties.memoryTypes[i] = {memory_types[i], 0};
		m_memory_properties.memoryHeapCount = 1;
		m_memory_properties.memoryHeaps[0] = {VkDeviceSize{1} << 32u, VK_MEMORY_HEAP_DEVICE_LOCAL_BIT};
		m_limits.minUniformBufferOffsetAlignment = 256;
	}

	// The call named `call` succeeds `skip` more times, then fails once
	inline void FailOn(const std::string &call, int skip = 0) { m_failures[call] = skip; }

	inline std::size_t GetLiveCount() const { return m_live.size(); }
	inline std::size_t GetLiveCount(const std::string &kind) const {
		return std::count_if(m_live.begin(), m_live.end(), [&kind](const auto &it) { return it.second == kind; });
	}
	inline std::size_t Count(const std::string &call) const { return std::count(log.begin(), log.end(), call); }
	// Position of the first log entry equal to call at or after from, or log.size()
	inline std::size_t Find(const std::string &call, std::size_t from = 0) const {
		return std::find(log.begin() + std::min(from, log.size()), log.end(), call) - log.begin();
	}
	inline const std::byte *GetBufferBytes(VkBuffer buffer) const {
		auto it = m_buffer_bindings.find(raw(buffer));
		if (it == m_buffer_bindings.end())
			return nullptr;
		return m_memories.at(raw(it->second.memory)).data() + it->second.offset;
	}
	inline Binding GetBufferBinding(VkBuffer buffer) const {
		auto it = m_buffer_bindings.find(raw(buffer));
		return it == m_buffer_bindings.end() ? Binding{} : it->second;
	}

	inline const VkPhysicalDeviceMemoryProperties &GetMemoryProperties() const final { return m_memory_properties; }
	inline const VkPhysicalDeviceLimits &GetLimits() const final { return m_limits; }

	inline VkResult AllocateMemory(const VkMemoryAllocateInfo &info, VkDeviceMemory *p_memory) const final {
		if (VkResult result = check("AllocateMemory"); result != VK_SUCCESS) {
			*p_memory = poison<VkDeviceMemory>();
			return result;
		}
		*p_memory = create<VkDeviceMemory>("Memory");
		m_memories[raw(*p_memory)].resize(info.allocationSize);
		return VK_SUCCESS;
	}
	inline void FreeMemory(VkDeviceMemory memory) const final {
		destroy(memory, "FreeMemory");
		m_memories.erase(raw(memory));
	}
	inline VkResult MapMemory(VkDeviceMemory memory, VkDeviceSize offset, VkDeviceSize, void **pp_data) const final {
		if (VkResult result = check("MapMemory"); result != VK_SUCCESS)
			return result;
		*pp_data = m_memories.at(raw(memory)).data() + offset;
		return VK_SUCCESS;
	}
	inline void UnmapMemory(VkDeviceMemory) const final { log.emplace_back("UnmapMemory"); }

	inline VkResult CreateBuffer(const VkBufferCreateInfo &info, VkBuffer *p_buffer) const final {
		if (VkResult result = check("CreateBuffer"); result != VK_SUCCESS) {
			*p_buffer = poison<VkBuffer>();
			return result;
		}
		*p_buffer = create<VkBuffer>("Buffer");
		m_buffer_sizes[raw(*p_buffer)] = info.size;
		return VK_SUCCESS;
	}
	inline void DestroyBuffer(VkBuffer buffer) const final {
		destroy(buffer, "DestroyBuffer");
		m_buffer_bindings.erase(raw(buffer));
		m_buffer_sizes.erase(raw(buffer));
	}
	inline void GetBufferMemoryRequirements(VkBuffer buffer, VkMemoryRequirements *p_requirements) const final {
		*p_requirements = {
		    .size = m_buffer_sizes.at(raw(buffer)),
		    .alignment = buffer_alignment,
		    .memoryTypeBits = buffer_memory_type_bits,
		};
	}
	inline VkResult BindBufferMemory(VkBuffer buffer, VkDeviceMemory memory, VkDeviceSize offset) const final {
		if (VkResult result = check("BindBufferMemory"); result != VK_SUCCESS)
			return result;
		if (offset % buffer_alignment)
			errors.push_back("BindBufferMemory at misaligned offset " + std::to_string(offset));
		m_buffer_bindings[raw(buffer)] = {memory, offset};
		return VK_SUCCESS;
	}

	inline VkResult CreateImage(const VkImageCreateInfo &info, VkImage *p_image) const final {
		if (VkResult result = check("CreateImage"); result != VK_SUCCESS) {
			*p_image = poison<VkImage>();
			return result;
		}
		*p_image = create<VkImage>("Image");
		m_image_requirements[raw(*p_image)] = {
		    .size = VkDeviceSize{info.extent.width} * info.extent.height * 4,
		    .alignment = image_alignment,
		    .memoryTypeBits = image_memory_type_bits,
		};
		return VK_SUCCESS;
	}
	inline void DestroyImage(VkImage image) const final {
		destroy(image, "DestroyImage");
		m_image_requirements.erase(raw(image));
	}
	inline void GetImageMemoryRequirements(VkImage image, VkMemoryRequirements *p_requirements) const final {
		*p_requirements = m_image_requirements.at(raw(image));
	}
	inline VkResult BindImageMemory(VkImage, VkDeviceMemory, VkDeviceSize offset) const final {
		if (VkResult result = check("BindImageMemory"); result != VK_SUCCESS)
			return result;
		if (offset % image_alignment)
			errors.push_back("BindImageMemory at misaligned offset " + std::to_string(offset));
		return VK_SUCCESS;
	}

	inline VkResult CreateImageView(const VkImageViewCreateInfo &, VkImageView *p_view) const final {
		if (VkResult result = check("CreateImageView"); result != VK_SUCCESS) {
			*p_view = poison<VkImageView>();
			return result;
		}
		*p_view = create<VkImageView>("ImageView");
		return VK_SUCCESS;
	}
	inline void DestroyImageView(VkImageView view) const final { destroy(view, "DestroyImageView"); }
	inline VkResult CreateSampler(const VkSamplerCreateInfo &, VkSampler *p_sampler) const final {
		if (VkResult result = check("CreateSampler"); result != VK_SUCCESS) {
			*p_sampler = poison<VkSampler>();
			return result;
		}
		*p_sampler = create<VkSampler>("Sampler");
		return VK_SUCCESS;
	}
	inline void DestroySampler(VkSampler sampler) const final { destroy(sampler, "DestroySampler"); }

	inline VkResult CreateShaderModule(const VkShaderModuleCreateInfo &, VkShaderModule *p_module) const final {
		if (VkResult result = check("CreateShaderModule"); result != VK_SUCCESS) {
			*p_module = poison<VkShaderModule>();
			return result;
		}
		*p_module = create<VkShaderModule>("ShaderModule");
		return VK_SUCCESS;
	}
	inline void DestroyShaderModule(VkShaderModule module) const final { destroy(module, "DestroyShaderModule"); }

	inline VkResult CreateDescriptorSetLayout(const VkDescriptorSetLayoutCreateInfo &,
	                                          VkDescriptorSetLayout *p_layout) const final {
		if (VkResult result = check("CreateDescriptorSetLayout"); result != VK_SUCCESS) {
			*p_layout = poison<VkDescriptorSetLayout>();
			return result;
		}
		*p_layout = create<VkDescriptorSetLayout>("DescriptorSetLayout");
		return VK_SUCCESS;
	}
	inline void DestroyDescriptorSetLayout(VkDescriptorSetLayout layout) const final {
		destroy(layout, "DestroyDescriptorSetLayout");
	}
	inline VkResult CreateDescriptorPool(const VkDescriptorPoolCreateInfo &, VkDescriptorPool *p_pool) const final {
		if (VkResult result = check("CreateDescriptorPool"); result != VK_SUCCESS) {
			*p_pool = poison<VkDescriptorPool>();
			return result;
		}
		*p_pool = create<VkDescriptorPool>("DescriptorPool");
		return VK_SUCCESS;
	}
	inline void DestroyDescriptorPool(VkDescriptorPool pool) const final { destroy(pool, "DestroyDescriptorPool"); }
	inline VkResult AllocateDescriptorSets(const VkDescriptorSetAllocateInfo &info, VkDescriptorSet *p_sets) const final {
		if (VkResult result = check("AllocateDescriptorSets"); result != VK_SUCCESS)
			return result;
		// Sets are owned by their pool
		for (uint32_t i = 0; i < info.descriptorSetCount; ++i)
			p_sets[i] = (VkDescriptorSet)(uintptr_t)(++m_counter);
		return VK_SUCCESS;
	}
	inline void UpdateDescriptorSets(std::span<const VkWriteDescriptorSet> writes) const final {
		log.emplace_back("UpdateDescriptorSets");
		update_count += writes.size();
	}

	inline VkResult CreatePipelineLayout(const VkPipelineLayoutCreateInfo &info, VkPipelineLayout *p_layout) const final {
		if (VkResult result = check("CreatePipelineLayout"); result != VK_SUCCESS) {
			*p_layout = poison<VkPipelineLayout>();
			return result;
		}
		last_set_layout_count = info.setLayoutCount;
		*p_layout = create<VkPipelineLayout>("PipelineLayout");
		return VK_SUCCESS;
	}
	inline void DestroyPipelineLayout(VkPipelineLayout layout) const final {
		destroy(layout, "DestroyPipelineLayout");
	}
	inline VkResult CreateGraphicsPipeline(const VkGraphicsPipelineCreateInfo &, VkPipeline *p_pipeline) const final {
		if (VkResult result = check("CreateGraphicsPipeline"); result != VK_SUCCESS) {
			*p_pipeline = poison<VkPipeline>();
			return result;
		}
		*p_pipeline = create<VkPipeline>("Pipeline");
		return VK_SUCCESS;
	}
	inline void DestroyPipeline(VkPipeline pipeline) const final { destroy(pipeline, "DestroyPipeline"); }

	inline VkResult CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions) const final {
		if (VkResult result = check("CopyBuffer"); result != VK_SUCCESS)
			return result;
		auto src_it = m_buffer_bindings.find(raw(src)), dst_it = m_buffer_bindings.find(raw(dst));
		if (src_it == m_buffer_bindings.end() || dst_it == m_buffer_bindings.end()) {
			errors.emplace_back("CopyBuffer between unbound buffers");
			return VK_SUCCESS;
		}
		const std::byte *src_bytes = m_memories.at(raw(src_it->second.memory)).data() + src_it->second.offset;
		std::byte *dst_bytes = m_memories.at(raw(dst_it->second.memory)).data() + dst_it->second.offset;
		for (const auto &region : regions) {
			if (region.srcOffset + region.size > m_buffer_sizes.at(raw(src)) ||
			    region.dstOffset + region.size > m_buffer_sizes.at(raw(dst))) {
				errors.emplace_back("CopyBuffer region out of bounds");
				continue;
			}
			std::memcpy(dst_bytes + region.dstOffset, src_bytes + region.srcOffset, region.size);
		}
		return VK_SUCCESS;
	}
	inline VkResult CopyBufferToImage(VkBuffer src, VkImage, const VkBufferImageCopy &region,
	                                  VkImageLayout) const final {
		if (VkResult result = check("CopyBufferToImage"); result != VK_SUCCESS)
			return result;
		// Every test image is 4 bytes per texel
		VkDeviceSize size = VkDeviceSize{region.imageExtent.width} * region.imageExtent.height * 4;
		if (region.bufferOffset + size > m_buffer_sizes.at(raw(src)))
			errors.emplace_back("CopyBufferToImage reads past the staging buffer");
		return VK_SUCCESS;
	}

	inline VkResult WaitIdle() const final { return check("WaitIdle"); }
};

#endif
