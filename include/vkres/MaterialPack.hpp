#pragma once
#ifndef VKRES_MATERIALPACK_HPP
#define VKRES_MATERIALPACK_HPP

#include "Pack.hpp"
#include "Texture.hpp"
#include "UniformBuffer.hpp"

#include <concepts>
#include <type_traits>
#include <variant>
#include <vector>

namespace vkres {

// A material declares its uniform block (or void) and a fixed number of sampled images
template <typename M>
concept Material = requires {
	typename M::Uniform;
	{ M::kImageCount } -> std::convertible_to<uint32_t>;
} && (M::kImageCount == 0 || requires(const M &material, uint32_t image) {
	{ material.GetImage(image) } -> std::convertible_to<const ImageData &>;
}) && (std::is_void_v<typename M::Uniform> || requires(const M &material) {
	{ material.GetUniform() } -> std::convertible_to<typename M::Uniform>;
});

// Set layout of a material: the uniform block at binding 0 if present, then one combined image sampler per image
std::vector<VkDescriptorSetLayoutBinding> GetMaterialBindings(bool has_uniform, uint32_t image_count);

struct MaterialBindData {
	VkDescriptorSet set;
	VkDescriptorSetLayout layout;
};

struct MaterialPackData {
	std::optional<UniformBufferBase> uniforms;
	std::vector<Texture> textures;
	uint32_t image_count{0};
	VkDescriptorSetLayout set_layout{VK_NULL_HANDLE};
	VkDescriptorPool pool{VK_NULL_HANDLE};
	std::vector<VkDescriptorSet> sets;

	inline std::size_t GetItemCount() const { return sets.size(); }
	template <typename M> inline MaterialBindData GetItem(std::size_t material) const {
		return {sets[material], set_layout};
	}

	// Creates the layout, pool and one set per material, then points the sets at uniforms and textures
	ResourceResult<void> CreateDescriptors(Context &ctx, uint32_t material_count);
	// Descriptor pool, set layout, textures, then the uniform buffer
	ResourceResult<void> Destroy(Context &ctx, Allocator &allocator);
};

template <Material M> using MaterialPack = Pack<M, MaterialPackData>;
template <Material M> using MaterialPackRef = PackRef<M, MaterialPackData>;
template <Material M> using MaterialHandle = Handle<M, MaterialPackData>;
using MaterialPackTypeErased = PackTypeErased<MaterialPackData>;
using MaterialPackTypeErasedList = PackTypeErasedList<MaterialPackData>;

template <Material M> class MaterialPackPartial;

template <Material M> struct MaterialPackConfig {
	using Key = M;
	using Data = MaterialPackData;
	using Partial = MaterialPackPartial<M>;

	std::vector<M> materials;

	inline bool IsEmpty() const { return materials.empty(); }
};

namespace _details_material_ {
template <typename U> struct UniformStorage {
	using Partial = UniformBufferPartial<U>;
	using Values = std::vector<U>;
};
template <> struct UniformStorage<void> {
	using Partial = std::monostate;
	using Values = std::monostate;
};
} // namespace _details_material_

template <Material M> class MaterialPackPartial {
private:
	using Uniform = typename M::Uniform;
	inline static constexpr bool kHasUniform = !std::is_void_v<Uniform>;
	inline static constexpr uint32_t kImageCount = M::kImageCount;
	static_assert(kHasUniform || kImageCount > 0, "Material without uniform and images");

	uint32_t m_index{0}, m_count{0};
	std::optional<typename _details_material_::UniformStorage<Uniform>::Partial> m_uniform;
	typename _details_material_::UniformStorage<Uniform>::Values m_uniform_values{};
	std::vector<TexturePartial> m_textures;

	inline void destroy_partials(Context &ctx) {
		if constexpr (kHasUniform) {
			if (m_uniform)
				std::move(*m_uniform).Destroy(ctx);
		}
		m_uniform.reset();
		for (auto &texture : m_textures)
			std::move(texture).Destroy(ctx);
		m_textures.clear();
	}

public:
	inline MaterialPackPartial() = default;

	static inline ResourceResult<MaterialPackPartial> Prepare(Context &ctx, uint32_t index,
	                                                          const MaterialPackConfig<M> &config) {
		if (config.materials.empty())
			return error::InvalidConfiguration{"material pack without materials"};

		MaterialPackPartial partial;
		partial.m_index = index;
		partial.m_count = config.materials.size();

		if constexpr (kHasUniform) {
			auto uniform_result = UniformBufferPartial<Uniform>::Prepare(ctx, partial.m_count);
			if (uniform_result.IsError())
				return uniform_result.PopError();
			partial.m_uniform.emplace(uniform_result.PopValue());
			for (const auto &material : config.materials)
				partial.m_uniform_values.push_back(material.GetUniform());
		}
		if constexpr (kImageCount > 0) {
			partial.m_textures.reserve(partial.m_count * kImageCount);
			for (const auto &material : config.materials)
				for (uint32_t image = 0; image < kImageCount; ++image) {
					auto texture_result = TexturePartial::Prepare(ctx, material.GetImage(image));
					if (texture_result.IsError()) {
						partial.destroy_partials(ctx);
						return texture_result.PopError();
					}
					partial.m_textures.push_back(texture_result.PopValue());
				}
		}
		return partial;
	}

	inline std::vector<AllocReqRaw> Requirements() const {
		std::vector<AllocReqRaw> reqs;
		if constexpr (kHasUniform) {
			if (m_uniform)
				reqs = m_uniform->Requirements();
		}
		for (const auto &texture : m_textures)
			reqs.push_back(texture.GetRequirement().GetRaw());
		return reqs;
	}

	inline ResourceResult<MaterialPack<M>> Finalize(Context &ctx, Allocator &allocator) && {
		MaterialPackData data;
		data.image_count = kImageCount;
		auto fail = [&](ResourceError error) -> ResourceResult<MaterialPack<M>> {
			destroy_partials(ctx);
			VKRES_CLEANUP(data.Destroy(ctx, allocator));
			return error;
		};

		if constexpr (kHasUniform) {
			auto uniform_result = std::move(*m_uniform).Finalize(ctx, allocator);
			m_uniform.reset();
			if (uniform_result.IsError())
				return fail(uniform_result.PopError());
			UniformBuffer<Uniform> uniforms = uniform_result.PopValue();
			for (uint32_t i = 0; i < m_count; ++i)
				uniforms.Write(i, m_uniform_values[i]);
			data.uniforms.emplace(std::move(uniforms));
		}
		for (auto &texture : m_textures) {
			auto texture_result = std::move(texture).Finalize(ctx, allocator);
			if (texture_result.IsError())
				return fail(texture_result.PopError());
			data.textures.push_back(texture_result.PopValue());
		}
		m_textures.clear();

		auto descriptor_result = data.CreateDescriptors(ctx, m_count);
		if (descriptor_result.IsError())
			return fail(descriptor_result.PopError());
		return MaterialPack<M>{m_index, std::move(data)};
	}

	inline void Destroy(Context &ctx) && { destroy_partials(ctx); }
};

} // namespace vkres

#endif
