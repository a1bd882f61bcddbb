#pragma once
#ifndef VKRES_PIPELINEPACK_HPP
#define VKRES_PIPELINEPACK_HPP

#include "MeshPack.hpp"
#include "Pack.hpp"

#include <vector>

namespace vkres {

// A shader type names its vertex format and the layout of its own descriptor set
template <typename S>
concept Shader = requires {
	typename S::Vertex;
	{ S::GetDescriptorBindings() } -> std::convertible_to<std::vector<VkDescriptorSetLayoutBinding>>;
	{ S::GetPushConstantRanges() } -> std::convertible_to<std::vector<VkPushConstantRange>>;
} && Vertex<typename S::Vertex>;

// SPIR-V words of one vertex + fragment pair
struct ShaderModules {
	std::vector<uint32_t> vertex, fragment;
};

// Attachment formats for dynamic rendering
struct PipelineRenderingFormats {
	std::vector<VkFormat> color_formats;
	VkFormat depth_format{VK_FORMAT_UNDEFINED};
};

struct PipelineBindData {
	VkPipeline pipeline;
	VkPipelineLayout layout;
};

struct PipelinePackData {
	VkDescriptorSetLayout set_layout{VK_NULL_HANDLE};
	VkPipelineLayout layout{VK_NULL_HANDLE};
	std::vector<VkPipeline> pipelines;

	inline std::size_t GetItemCount() const { return pipelines.size(); }
	template <typename S> inline PipelineBindData GetItem(std::size_t pipeline) const {
		return {pipelines[pipeline], layout};
	}
	// Pipelines, pipeline layout, then descriptor set layout
	ResourceResult<void> Destroy(Context &ctx, Allocator &allocator);
};

template <Shader S> using PipelinePack = Pack<S, PipelinePackData>;
template <Shader S> using PipelinePackRef = PackRef<S, PipelinePackData>;
template <Shader S> using PipelineHandle = Handle<S, PipelinePackData>;
using PipelinePackTypeErased = PackTypeErased<PipelinePackData>;
using PipelinePackTypeErasedList = PackTypeErasedList<PipelinePackData>;

struct PipelineLayoutInfo {
	std::vector<VkDescriptorSetLayoutBinding> bindings;
	std::vector<VkPushConstantRange> push_constant_ranges;
	// Sets bound after the shader's own set, e.g. material layouts
	std::vector<VkDescriptorSetLayout> extra_set_layouts;
};
struct VertexInputInfo {
	uint32_t stride;
	std::vector<VkVertexInputAttributeDescription> attributes;
};

// Untyped halves of PipelinePackPartial
ResourceResult<PipelinePackData> CreatePipelineLayouts(Context &ctx, const PipelineLayoutInfo &info);
ResourceResult<VkPipeline> CreateGraphicsPipeline(Context &ctx, VkPipelineLayout layout, const ShaderModules &modules,
                                                  const VertexInputInfo &vertex_input,
                                                  const PipelineRenderingFormats &formats);

template <Shader S> class PipelinePackPartial;

template <Shader S> struct PipelinePackConfig {
	using Key = S;
	using Data = PipelinePackData;
	using Partial = PipelinePackPartial<S>;

	std::vector<ShaderModules> modules;
	PipelineRenderingFormats formats;
	std::vector<VkDescriptorSetLayout> extra_set_layouts;

	inline bool IsEmpty() const { return modules.empty(); }
};

// Layouts are created by Prepare, pipelines by Finalize. Needs no memory.
template <Shader S> class PipelinePackPartial {
private:
	uint32_t m_index{0};
	std::optional<PipelinePackData> m_data;
	std::vector<ShaderModules> m_modules;
	PipelineRenderingFormats m_formats;

public:
	inline PipelinePackPartial() = default;
	inline PipelinePackPartial(PipelinePackPartial &&other) noexcept
	    : m_index{other.m_index}, m_data{std::exchange(other.m_data, std::nullopt)},
	      m_modules{std::move(other.m_modules)}, m_formats{std::move(other.m_formats)} {}
	PipelinePackPartial(const PipelinePackPartial &) = delete;
	PipelinePackPartial &operator=(const PipelinePackPartial &) = delete;
	inline ~PipelinePackPartial() { assert(!m_data && "PipelinePackPartial dropped without Finalize or Destroy"); }

	static inline ResourceResult<PipelinePackPartial> Prepare(Context &ctx, uint32_t index,
	                                                          const PipelinePackConfig<S> &config) {
		if (config.modules.empty())
			return error::InvalidConfiguration{"pipeline pack without shader modules"};
		PipelineLayoutInfo layout_info = {
		    .bindings = S::GetDescriptorBindings(),
		    .push_constant_ranges = S::GetPushConstantRanges(),
		    .extra_set_layouts = config.extra_set_layouts,
		};
		auto data_result = CreatePipelineLayouts(ctx, layout_info);
		if (data_result.IsError())
			return data_result.PopError();

		PipelinePackPartial partial;
		partial.m_index = index;
		partial.m_data.emplace(data_result.PopValue());
		partial.m_modules = config.modules;
		partial.m_formats = config.formats;
		return partial;
	}

	inline std::vector<AllocReqRaw> Requirements() const { return {}; }

	inline ResourceResult<PipelinePack<S>> Finalize(Context &ctx, Allocator &allocator) && {
		assert(m_data);
		PipelinePackData data = std::move(*m_data);
		m_data.reset();

		VertexInputInfo vertex_input = {
		    .stride = sizeof(typename S::Vertex),
		    .attributes = S::Vertex::GetAttributes(),
		};
		for (const auto &modules : m_modules) {
			auto pipeline_result = CreateGraphicsPipeline(ctx, data.layout, modules, vertex_input, m_formats);
			if (pipeline_result.IsError()) {
				VKRES_CLEANUP(data.Destroy(ctx, allocator));
				return pipeline_result.PopError();
			}
			data.pipelines.push_back(pipeline_result.PopValue());
		}
		m_modules.clear();
		return PipelinePack<S>{m_index, std::move(data)};
	}

	inline void Destroy(Context &ctx) && {
		if (!m_data)
			return;
		const Device &device = ctx.GetDevice();
		device.DestroyPipelineLayout(m_data->layout);
		device.DestroyDescriptorSetLayout(m_data->set_layout);
		m_data.reset();
	}
};

} // namespace vkres

#endif
