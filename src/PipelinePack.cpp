#include "vkres/PipelinePack.hpp"

#include "vkres/ErrorMacro.hpp"

#include <array>

namespace vkres {

ResourceResult<void> PipelinePackData::Destroy(Context &ctx, Allocator &) {
	const Device &device = ctx.GetDevice();
	for (VkPipeline pipeline : pipelines)
		device.DestroyPipeline(pipeline);
	pipelines.clear();
	if (layout != VK_NULL_HANDLE)
		device.DestroyPipelineLayout(layout);
	if (set_layout != VK_NULL_HANDLE)
		device.DestroyDescriptorSetLayout(set_layout);
	layout = VK_NULL_HANDLE;
	set_layout = VK_NULL_HANDLE;
	return {};
}

ResourceResult<PipelinePackData> CreatePipelineLayouts(Context &ctx, const PipelineLayoutInfo &info) {
	const Device &device = ctx.GetDevice();
	PipelinePackData data;

	VkDescriptorSetLayoutCreateInfo set_layout_info = {
	    .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
	    .bindingCount = (uint32_t)info.bindings.size(),
	    .pBindings = info.bindings.data(),
	};
	VKRES_CHECK_VK(device.CreateDescriptorSetLayout(set_layout_info, &data.set_layout), "vkCreateDescriptorSetLayout");

	std::vector<VkDescriptorSetLayout> set_layouts = {data.set_layout};
	set_layouts.insert(set_layouts.end(), info.extra_set_layouts.begin(), info.extra_set_layouts.end());
	VkPipelineLayoutCreateInfo layout_info = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO,
	    .setLayoutCount = (uint32_t)set_layouts.size(),
	    .pSetLayouts = set_layouts.data(),
	    .pushConstantRangeCount = (uint32_t)info.push_constant_ranges.size(),
	    .pPushConstantRanges = info.push_constant_ranges.data(),
	};
	VkResult vk_result = device.CreatePipelineLayout(layout_info, &data.layout);
	if (vk_result != VK_SUCCESS) {
		device.DestroyDescriptorSetLayout(data.set_layout);
		return error::DeviceError{vk_result, "vkCreatePipelineLayout"};
	}
	return data;
}

namespace {
ResourceResult<VkShaderModule> create_shader_module(const Device &device, const std::vector<uint32_t> &code) {
	VkShaderModuleCreateInfo create_info = {
	    .sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
	    .codeSize = code.size() * sizeof(uint32_t),
	    .pCode = code.data(),
	};
	VkShaderModule module;
	VKRES_CHECK_VK(device.CreateShaderModule(create_info, &module), "vkCreateShaderModule");
	return module;
}
} // namespace

ResourceResult<VkPipeline> CreateGraphicsPipeline(Context &ctx, VkPipelineLayout layout, const ShaderModules &modules,
                                                  const VertexInputInfo &vertex_input,
                                                  const PipelineRenderingFormats &formats) {
	const Device &device = ctx.GetDevice();

	VkShaderModule vert_module, frag_module;
	VKRES_UNWRAP_ASSIGN(vert_module, create_shader_module(device, modules.vertex));
	{
		auto frag_result = create_shader_module(device, modules.fragment);
		if (frag_result.IsError()) {
			device.DestroyShaderModule(vert_module);
			return frag_result.PopError();
		}
		frag_module = frag_result.PopValue();
	}

	std::array<VkPipelineShaderStageCreateInfo, 2> stages = {{
	    {
	        .sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
	        .stage = VK_SHADER_STAGE_VERTEX_BIT,
	        .module = vert_module,
	        .pName = "main",
	    },
	    {
	        .sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
	        .stage = VK_SHADER_STAGE_FRAGMENT_BIT,
	        .module = frag_module,
	        .pName = "main",
	    },
	}};

	VkVertexInputBindingDescription binding = {
	    .binding = 0,
	    .stride = vertex_input.stride,
	    .inputRate = VK_VERTEX_INPUT_RATE_VERTEX,
	};
	VkPipelineVertexInputStateCreateInfo vertex_input_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO,
	    .vertexBindingDescriptionCount = 1,
	    .pVertexBindingDescriptions = &binding,
	    .vertexAttributeDescriptionCount = (uint32_t)vertex_input.attributes.size(),
	    .pVertexAttributeDescriptions = vertex_input.attributes.data(),
	};
	VkPipelineInputAssemblyStateCreateInfo input_assembly_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO,
	    .topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST,
	};
	VkPipelineViewportStateCreateInfo viewport_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO,
	    .viewportCount = 1,
	    .scissorCount = 1,
	};
	VkPipelineRasterizationStateCreateInfo rasterization_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO,
	    .polygonMode = VK_POLYGON_MODE_FILL,
	    .cullMode = VK_CULL_MODE_BACK_BIT,
	    .frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE,
	    .lineWidth = 1.0f,
	};
	VkPipelineMultisampleStateCreateInfo multisample_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO,
	    .rasterizationSamples = VK_SAMPLE_COUNT_1_BIT,
	};
	bool has_depth = formats.depth_format != VK_FORMAT_UNDEFINED;
	VkPipelineDepthStencilStateCreateInfo depth_stencil_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO,
	    .depthTestEnable = has_depth,
	    .depthWriteEnable = has_depth,
	    .depthCompareOp = VK_COMPARE_OP_LESS,
	};
	std::vector<VkPipelineColorBlendAttachmentState> blend_attachments(
	    formats.color_formats.size(),
	    VkPipelineColorBlendAttachmentState{
	        .blendEnable = VK_FALSE,
	        .colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT |
	                          VK_COLOR_COMPONENT_A_BIT,
	    });
	VkPipelineColorBlendStateCreateInfo color_blend_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO,
	    .attachmentCount = (uint32_t)blend_attachments.size(),
	    .pAttachments = blend_attachments.data(),
	};
	std::array<VkDynamicState, 2> dynamic_states = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
	VkPipelineDynamicStateCreateInfo dynamic_state = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO,
	    .dynamicStateCount = (uint32_t)dynamic_states.size(),
	    .pDynamicStates = dynamic_states.data(),
	};
	VkPipelineRenderingCreateInfo rendering_info = {
	    .sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO,
	    .colorAttachmentCount = (uint32_t)formats.color_formats.size(),
	    .pColorAttachmentFormats = formats.color_formats.data(),
	    .depthAttachmentFormat = formats.depth_format,
	};

	VkGraphicsPipelineCreateInfo create_info = {
	    .sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO,
	    .pNext = &rendering_info,
	    .stageCount = (uint32_t)stages.size(),
	    .pStages = stages.data(),
	    .pVertexInputState = &vertex_input_state,
	    .pInputAssemblyState = &input_assembly_state,
	    .pViewportState = &viewport_state,
	    .pRasterizationState = &rasterization_state,
	    .pMultisampleState = &multisample_state,
	    .pDepthStencilState = &depth_stencil_state,
	    .pColorBlendState = &color_blend_state,
	    .pDynamicState = &dynamic_state,
	    .layout = layout,
	};
	VkPipeline pipeline;
	VkResult vk_result = device.CreateGraphicsPipeline(create_info, &pipeline);

	// Modules are only needed while the pipeline is being created
	device.DestroyShaderModule(frag_module);
	device.DestroyShaderModule(vert_module);

	if (vk_result != VK_SUCCESS)
		return error::DeviceError{vk_result, "vkCreateGraphicsPipelines"};
	return pipeline;
}

} // namespace vkres
