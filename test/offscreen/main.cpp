#include <vkres/PackList.hpp>
#include <vkres/PageAllocator.hpp>
#include <vkres/VmaBackedAllocator.hpp>
#include <vkres/VulkanDevice.hpp>

#include <cstdio>

namespace {
struct Vertex {
	float pos[3];
	static std::vector<VkVertexInputAttributeDescription> GetAttributes() {
		return {{0, 0, VK_FORMAT_R32G32B32_SFLOAT, 0}};
	}
};
struct Checker {
	using Uniform = void;
	inline static constexpr uint32_t kImageCount = 1;
	vkres::ImageData image;
	const vkres::ImageData &GetImage(uint32_t) const { return image; }
};

vkres::ImageData make_checker(uint32_t size) {
	vkres::ImageData data{.width = size, .height = size};
	data.pixels.resize(size * size * 4);
	for (uint32_t y = 0; y < size; ++y)
		for (uint32_t x = 0; x < size; ++x)
			for (uint32_t c = 0; c < 4; ++c)
				data.pixels[(y * size + x) * 4 + c] = ((x ^ y) & 1) ? std::byte{0xff} : std::byte{0x00};
	return data;
}

using Configs = vkres::MakeList<vkres::MeshPackConfig<Vertex>, vkres::MaterialPackConfig<Checker>>;

Configs make_configs() {
	Configs configs;
	vkres::Get<vkres::MeshPackConfig<Vertex>>(configs).meshes = {
	    {{{{0.0f, 0.0f, 0.0f}}, {{1.0f, 0.0f, 0.0f}}, {{0.0f, 1.0f, 0.0f}}}, {0, 1, 2}},
	    {{{{0.0f, 0.0f, 1.0f}}, {{1.0f, 0.0f, 1.0f}}, {{1.0f, 1.0f, 1.0f}}, {{0.0f, 1.0f, 1.0f}}}, {0, 1, 2, 2, 3, 0}},
	};
	vkres::Get<vkres::MaterialPackConfig<Checker>>(configs).materials = {{make_checker(16)}, {make_checker(64)}};
	return configs;
}

// Loads the pack list with the given allocator, reports what was loaded, then tears it down
bool load_scene(vkres::Context &ctx, vkres::Allocator &allocator, const char *name) {
	auto list_result = vkres::PackList<Configs>::Load(ctx, allocator, make_configs());
	if (list_result.IsError()) {
		printf("%s: %s\n", name, list_result.GetError().Format().c_str());
		return false;
	}
	auto list = list_result.PopValue();
	auto meshes = list.TryGetMeshes<Vertex>();
	auto materials = list.TryGetMaterials<Checker>();
	printf("%s: %zu meshes, %zu materials\n", name, meshes ? meshes->GetItemCount() : 0,
	       materials ? materials->GetItemCount() : 0);
	if (meshes) {
		for (uint32_t i = 0; i < meshes->GetItemCount(); ++i) {
			auto bind = meshes->GetData().GetBindData<Vertex>(i);
			printf("  mesh %u: %u vertices at %llu, %u indices at %llu\n", i, bind.vertex_count,
			       (unsigned long long)bind.vertex_offset, bind.index_count, (unsigned long long)bind.index_offset);
		}
	}
	auto destroy_result = list.Destroy(ctx, allocator);
	if (destroy_result.IsError()) {
		printf("%s: %s\n", name, destroy_result.GetError().Format().c_str());
		return false;
	}
	return true;
}
} // namespace

int main() {
	auto device = vkres::VulkanDevice::Create(vkres::VulkanDeviceCreateInfo{.validation = true});
	if (!device) {
		printf("No usable Vulkan device\n");
		return 1;
	}
	printf("Device: %s\n", device->GetPhysicalDevicePtr()->GetProperties().deviceName);

	vkres::Context ctx{device};
	bool ok = true;
	{
		vkres::PageAllocator allocator{vkres::PageAllocatorConfig{.page_size = 16u << 20u}};
		ok = load_scene(ctx, allocator, "PageAllocator") && ok;
		allocator.Destroy(ctx);
	}
	{
		vkres::VmaBackedAllocator allocator{device->GetAllocatorHandle()};
		ok = load_scene(ctx, allocator, "VmaBackedAllocator") && ok;
		allocator.Destroy(ctx);
	}
	if (device->WaitIdle() != VK_SUCCESS)
		ok = false;
	ctx.Destroy();
	return ok ? 0 : 1;
}
