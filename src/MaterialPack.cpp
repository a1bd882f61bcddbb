#include "vkres/MaterialPack.hpp"

namespace vkres {

std::vector<VkDescriptorSetLayoutBinding> GetMaterialBindings(bool has_uniform, uint32_t image_count) {
	std::vector<VkDescriptorSetLayoutBinding> bindings;
	uint32_t binding = 0;
	if (has_uniform)
		bindings.push_back({
		    .binding = binding++,
		    .descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
		    .descriptorCount = 1,
		    .stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT,
		});
	for (uint32_t i = 0; i < image_count; ++i)
		bindings.push_back({
		    .binding = binding++,
		    .descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
		    .descriptorCount = 1,
		    .stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT,
		});
	return bindings;
}

ResourceResult<void> MaterialPackData::CreateDescriptors(Context &ctx, uint32_t material_count) {
	const Device &device = ctx.GetDevice();
	bool has_uniform = uniforms.has_value();
	assert(textures.size() == material_count * image_count);

	auto bindings = GetMaterialBindings(has_uniform, image_count);
	VkDescriptorSetLayoutCreateInfo layout_info = {
	    .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
	    .bindingCount = (uint32_t)bindings.size(),
	    .pBindings = bindings.data(),
	};
	VkResult vk_result = device.CreateDescriptorSetLayout(layout_info, &set_layout);
	if (vk_result != VK_SUCCESS) {
		set_layout = VK_NULL_HANDLE;
		return error::DeviceError{vk_result, "vkCreateDescriptorSetLayout"};
	}

	std::vector<VkDescriptorPoolSize> pool_sizes;
	if (has_uniform)
		pool_sizes.push_back({VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, material_count});
	if (image_count)
		pool_sizes.push_back({VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, material_count * image_count});
	VkDescriptorPoolCreateInfo pool_info = {
	    .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
	    .maxSets = material_count,
	    .poolSizeCount = (uint32_t)pool_sizes.size(),
	    .pPoolSizes = pool_sizes.data(),
	};
	vk_result = device.CreateDescriptorPool(pool_info, &pool);
	if (vk_result != VK_SUCCESS) {
		pool = VK_NULL_HANDLE;
		return error::DeviceError{vk_result, "vkCreateDescriptorPool"};
	}

	std::vector<VkDescriptorSetLayout> set_layouts(material_count, set_layout);
	VkDescriptorSetAllocateInfo alloc_info = {
	    .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO,
	    .descriptorPool = pool,
	    .descriptorSetCount = material_count,
	    .pSetLayouts = set_layouts.data(),
	};
	sets.resize(material_count);
	vk_result = device.AllocateDescriptorSets(alloc_info, sets.data());
	if (vk_result != VK_SUCCESS) {
		sets.clear();
		return error::DeviceError{vk_result, "vkAllocateDescriptorSets"};
	}

	std::vector<VkDescriptorBufferInfo> buffer_infos;
	std::vector<VkDescriptorImageInfo> image_infos;
	buffer_infos.reserve(material_count);
	image_infos.reserve(textures.size());
	std::vector<VkWriteDescriptorSet> writes;
	for (uint32_t material = 0; material < material_count; ++material) {
		uint32_t binding = 0;
		if (has_uniform) {
			buffer_infos.push_back(uniforms->GetDescriptorInfo(material));
			writes.push_back({
			    .sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
			    .dstSet = sets[material],
			    .dstBinding = binding++,
			    .descriptorCount = 1,
			    .descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
			    .pBufferInfo = &buffer_infos.back(),
			});
		}
		for (uint32_t image = 0; image < image_count; ++image) {
			image_infos.push_back(textures[material * image_count + image].GetDescriptorInfo());
			writes.push_back({
			    .sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
			    .dstSet = sets[material],
			    .dstBinding = binding++,
			    .descriptorCount = 1,
			    .descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
			    .pImageInfo = &image_infos.back(),
			});
		}
	}
	device.UpdateDescriptorSets(writes);
	return {};
}

ResourceResult<void> MaterialPackData::Destroy(Context &ctx, Allocator &allocator) {
	const Device &device = ctx.GetDevice();
	if (pool != VK_NULL_HANDLE)
		device.DestroyDescriptorPool(pool);
	if (set_layout != VK_NULL_HANDLE)
		device.DestroyDescriptorSetLayout(set_layout);
	pool = VK_NULL_HANDLE;
	set_layout = VK_NULL_HANDLE;
	sets.clear();

	std::optional<ResourceError> first_error;
	for (auto &texture : textures) {
		auto result = texture.Destroy(ctx, allocator);
		if (result.IsError() && !first_error)
			first_error = result.PopError();
	}
	textures.clear();
	if (uniforms) {
		auto result = uniforms->Destroy(ctx, allocator);
		if (result.IsError() && !first_error)
			first_error = result.PopError();
		uniforms.reset();
	}
	if (first_error)
		return *first_error;
	return {};
}

} // namespace vkres
