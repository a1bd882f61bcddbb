#include <doctest/doctest.h>

#include "MockDevice.hpp"

#include <vkres/DefaultAllocator.hpp>
#include <vkres/PageAllocator.hpp>
#include <vkres/StaticAllocator.hpp>

#include <memory>

using namespace vkres;

namespace {
AllocReqRaw make_req(VkDeviceSize size, VkDeviceSize alignment, uint32_t bits, VkMemoryPropertyFlags flags,
                     const char *memory_class = "Test") {
	return {VkMemoryRequirements{size, alignment, bits}, flags, memory_class};
}
template <MemoryProperties M> AllocReq<M> make_typed_req(VkDeviceSize size, VkDeviceSize alignment) {
	return {VkMemoryRequirements{size, alignment, ~0u}};
}
} // namespace

TEST_SUITE("Memory Type") {
	TEST_CASE("Selection") {
		MockDevice device{{
		    VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
		    VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT,
		    VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
		    VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
		}};
		const auto &props = device.GetMemoryProperties();
		CHECK_EQ(GetMemoryTypeIndex(props, 0b0110, HostCoherent::kFlags), 2);
		CHECK_EQ(GetMemoryTypeIndex(props, 0b0110, HostVisible::kFlags), 1);
		CHECK_EQ(GetMemoryTypeIndex(props, 0b1110, DeviceLocal::kFlags), 3);
		CHECK_EQ(GetMemoryTypeIndex(props, 0b1111, DeviceLocal::kFlags), 0);
		CHECK_FALSE(GetMemoryTypeIndex(props, 0b0110, DeviceLocal::kFlags));

		auto result = GetMemoryTypeIndex(device, make_req(64, 1, 0b0001, HostCoherent::kFlags, "HostCoherent"));
		REQUIRE(result.IsError());
		CHECK(result.GetError().Is<error::UnsupportedMemoryType>());
		CHECK_NE(result.GetError().Format().find("HostCoherent"), std::string::npos);
	}
}

TEST_SUITE("Default Allocator") {
	TEST_CASE("One Memory Per Request") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		DefaultAllocator allocator;

		auto a = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1000, 256));
		auto b = allocator.Allocate(ctx, make_typed_req<HostCoherent>(10, 1));
		REQUIRE(a.IsOK());
		REQUIRE(b.IsOK());
		MemoryChunk<DeviceLocal> chunk_a = a.PopValue();
		MemoryChunk<HostCoherent> chunk_b = b.PopValue();
		CHECK_NE(chunk_a.GetHandle(), chunk_b.GetHandle());
		CHECK_EQ(chunk_a.GetRange(), ByteRange{0, 1000});
		CHECK_EQ(allocator.GetAllocationCount(), 2);
		CHECK_EQ(device->GetLiveCount("Memory"), 2);
		CHECK_EQ(ctx.GetStorage().GetCount<MemoryRaw>(), 2);

		REQUIRE(allocator.Free(ctx, chunk_a).IsOK());
		CHECK(chunk_a.IsEmpty());
		CHECK_EQ(device->GetLiveCount("Memory"), 1);
		// Freeing an emptied chunk does nothing
		CHECK(allocator.Free(ctx, chunk_a).IsOK());
		CHECK_EQ(device->Count("FreeMemory"), 1);

		REQUIRE(allocator.Free(ctx, chunk_b).IsOK());
		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
		CHECK(device->errors.empty());
	}

	TEST_CASE("Foreign Chunk") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		DefaultAllocator owner, other;

		MemoryChunk<DeviceLocal> chunk = owner.Allocate(ctx, make_typed_req<DeviceLocal>(64, 1)).PopValue();
		MemoryChunk<DeviceLocal> copy = chunk;
		auto result = other.Free(ctx, copy);
		REQUIRE(result.IsError());
		REQUIRE(result.GetError().Is<error::InvalidAllocation>());
		CHECK_NE(result.GetError().Format().find("DeviceLocal"), std::string::npos);
		CHECK_FALSE(copy.IsEmpty());

		REQUIRE(owner.Free(ctx, chunk).IsOK());
		owner.Destroy(ctx);
		other.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}

	TEST_CASE("Out Of Device Memory") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		DefaultAllocator allocator;

		device->FailOn("AllocateMemory");
		auto result = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1 << 20, 1));
		REQUIRE(result.IsError());
		REQUIRE(result.GetError().Is<error::OutOfMemory>());
		CHECK_EQ(result.GetError().Get<error::OutOfMemory>()->size, 1 << 20);
		CHECK_EQ(allocator.GetAllocationCount(), 0);

		allocator.Destroy(ctx);
		ctx.Destroy();
	}

	TEST_CASE("Reference Counted Mapping") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		DefaultAllocator allocator;

		MemoryChunk<HostCoherent> chunk = allocator.Allocate(ctx, make_typed_req<HostCoherent>(64, 1)).PopValue();
		void *first = allocator.Map(ctx, chunk).PopValue();
		void *second = allocator.Map(ctx, chunk).PopValue();
		CHECK_EQ(first, second);
		CHECK_EQ(device->Count("MapMemory"), 1);

		REQUIRE(allocator.Unmap(ctx, chunk).IsOK());
		CHECK_EQ(device->Count("UnmapMemory"), 0);
		REQUIRE(allocator.Unmap(ctx, chunk).IsOK());
		CHECK_EQ(device->Count("UnmapMemory"), 1);

		// Freeing a still mapped memory unmaps it first
		allocator.Map(ctx, chunk).PopValue();
		REQUIRE(allocator.Free(ctx, chunk).IsOK());
		CHECK_EQ(device->Count("UnmapMemory"), 2);
		std::size_t free_pos = device->Find("FreeMemory");
		REQUIRE_GT(free_pos, 0);
		CHECK_EQ(device->log[free_pos - 1], "UnmapMemory");

		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}
}

TEST_SUITE("Static Allocator") {
	TEST_CASE("Planned Requests Always Fit") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};

		std::vector<AllocReqRaw> reqs = {
		    make_req(100, 64, ~0u, DeviceLocal::kFlags, DeviceLocal::kName),
		    make_req(300, 256, ~0u, DeviceLocal::kFlags, DeviceLocal::kName),
		    make_req(17, 4, ~0u, HostCoherent::kFlags, HostCoherent::kName),
		    make_req(1, 1024, ~0u, DeviceLocal::kFlags, DeviceLocal::kName),
		    make_req(50, 8, ~0u, HostCoherent::kFlags, HostCoherent::kName),
		};
		StaticAllocatorConfig config;
		REQUIRE(config.AddAllocations(*device, reqs).IsOK());
		CHECK_EQ(config.GetPlans().size(), 2);
		CHECK_EQ(config.GetSize(0), 1025);
		CHECK_EQ(config.GetSize(1), 74);

		StaticAllocator allocator = StaticAllocator::Create(ctx, config).PopValue();
		CHECK_EQ(allocator.GetPoolCount(), 2);
		CHECK_EQ(device->Count("AllocateMemory"), 2);

		std::vector<MemoryChunkRaw> chunks;
		std::vector<MemoryChunk<DeviceLocal>> device_chunks;
		for (const auto &req : reqs) {
			if (req.flags == DeviceLocal::kFlags) {
				auto result = allocator.Allocate(ctx, AllocReq<DeviceLocal>{req.requirements});
				REQUIRE(result.IsOK());
				device_chunks.push_back(result.PopValue());
				const auto &range = device_chunks.back().GetRange();
				CHECK_EQ(range.beg % req.requirements.alignment, 0);
				CHECK_EQ(range.Size(), req.requirements.size);
				CHECK_LE(range.end, config.GetSize(0));
			} else {
				auto result = allocator.Allocate(ctx, AllocReq<HostCoherent>{req.requirements});
				REQUIRE(result.IsOK());
				CHECK_LE(result.GetValue().GetRange().end, config.GetSize(1));
				MemoryChunk<HostCoherent> chunk = result.PopValue();
				REQUIRE(allocator.Free(ctx, chunk).IsOK());
			}
		}
		for (std::size_t i = 0; i < device_chunks.size(); ++i)
			for (std::size_t j = i + 1; j < device_chunks.size(); ++j)
				CHECK_FALSE(device_chunks[i].GetRange().Overlaps(device_chunks[j].GetRange()));
		CHECK_EQ(allocator.GetRemaining(0), 0);

		for (auto &chunk : device_chunks)
			REQUIRE(allocator.Free(ctx, chunk).IsOK());
		// Freed space is not reused
		CHECK_EQ(allocator.GetRemaining(0), 0);
		CHECK_EQ(device->Count("FreeMemory"), 0);

		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}

	TEST_CASE("Subset Of Plan Fits") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};

		StaticAllocatorConfig config;
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(512, 256)).IsOK());
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(512, 256)).IsOK());
		StaticAllocator allocator = StaticAllocator::Create(ctx, config).PopValue();

		auto chunk = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(300, 256)).PopValue();
		CHECK_EQ(allocator.GetRemaining(0), 1024 - 300);
		REQUIRE(allocator.Free(ctx, chunk).IsOK());
		allocator.Destroy(ctx);
		ctx.Destroy();
	}

	TEST_CASE("Allocation Order Must Follow The Plan") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};

		StaticAllocatorConfig config;
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(1, 1)).IsOK());
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(1, 1)).IsOK());
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(256, 256)).IsOK());
		CHECK_EQ(config.GetSize(0), 512);
		StaticAllocator allocator = StaticAllocator::Create(ctx, config).PopValue();

		// Same total bytes, but the aligned request moves ahead and pads the pool past its end
		auto first = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1, 1)).PopValue();
		auto aligned = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(256, 256)).PopValue();
		CHECK_EQ(aligned.GetRange().beg, 256);
		auto last = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1, 1));
		REQUIRE(last.IsError());
		CHECK(last.GetError().Is<error::OutOfMemory>());
		CHECK_EQ(allocator.GetRemaining(0), 0);

		REQUIRE(allocator.Free(ctx, first).IsOK());
		REQUIRE(allocator.Free(ctx, aligned).IsOK());
		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}

	TEST_CASE("Overflow") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};

		StaticAllocatorConfig config;
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(1000, 1)).IsOK());
		StaticAllocator allocator = StaticAllocator::Create(ctx, config).PopValue();

		auto chunk = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(600, 1)).PopValue();
		auto overflow = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(600, 1));
		REQUIRE(overflow.IsError());
		CHECK(overflow.GetError().Is<error::OutOfMemory>());
		CHECK_EQ(allocator.GetRemaining(0), 400);

		// Nothing was planned for this memory type
		auto unplanned = allocator.Allocate(ctx, make_typed_req<HostCoherent>(1, 1));
		REQUIRE(unplanned.IsError());
		CHECK(unplanned.GetError().Is<error::OutOfMemory>());
		CHECK_NE(unplanned.GetError().Format().find("HostCoherent"), std::string::npos);

		REQUIRE(allocator.Free(ctx, chunk).IsOK());
		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}

	TEST_CASE("Create Cleans Up On Failure") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};

		StaticAllocatorConfig config;
		REQUIRE(config.AddAllocation(*device, make_typed_req<DeviceLocal>(64, 1)).IsOK());
		REQUIRE(config.AddAllocation(*device, make_typed_req<HostCoherent>(64, 1)).IsOK());
		device->FailOn("AllocateMemory", 1);
		auto result = StaticAllocator::Create(ctx, config);
		REQUIRE(result.IsError());
		CHECK(result.GetError().Is<error::OutOfMemory>());
		CHECK_EQ(device->GetLiveCount(), 0);
		CHECK(ctx.GetStorage().IsEmpty());
		ctx.Destroy();
	}
}

TEST_SUITE("Page Allocator") {
	TEST_CASE("Sub Allocation Shares A Page") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		PageAllocator allocator{PageAllocatorConfig{.page_size = 4096, .retained_empty_pages = 0}};

		auto a = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1000, 256)).PopValue();
		auto b = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1000, 256)).PopValue();
		CHECK_EQ(a.GetHandle(), b.GetHandle());
		CHECK_EQ(a.GetRange(), ByteRange{0, 1000});
		CHECK_EQ(b.GetRange(), ByteRange{1024, 2024});
		CHECK_EQ(allocator.GetPageCount(0), 1);
		CHECK_EQ(device->Count("AllocateMemory"), 1);

		// Does not fit in the remainder of the first page
		auto c = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(3000, 1)).PopValue();
		CHECK_NE(c.GetHandle(), a.GetHandle());
		CHECK_EQ(allocator.GetPageCount(0), 2);

		REQUIRE(allocator.Free(ctx, a).IsOK());
		REQUIRE(allocator.Free(ctx, b).IsOK());
		CHECK_EQ(allocator.GetPageCount(0), 1);
		REQUIRE(allocator.Free(ctx, c).IsOK());
		CHECK_EQ(allocator.GetPageCount(0), 0);
		CHECK_EQ(device->GetLiveCount("Memory"), 0);

		allocator.Destroy(ctx);
		ctx.Destroy();
	}

	TEST_CASE("Freed Ranges Coalesce") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		PageAllocator allocator{PageAllocatorConfig{.page_size = 3000, .retained_empty_pages = 1}};

		auto a = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1000, 1)).PopValue();
		auto b = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1000, 1)).PopValue();
		auto c = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(1000, 1)).PopValue();
		VkDeviceMemory page = a.GetHandle();

		// Neither hole alone fits 2000 bytes
		REQUIRE(allocator.Free(ctx, a).IsOK());
		REQUIRE(allocator.Free(ctx, c).IsOK());
		REQUIRE(allocator.Free(ctx, b).IsOK());
		auto big = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(3000, 1)).PopValue();
		CHECK_EQ(big.GetHandle(), page);
		CHECK_EQ(big.GetRange(), ByteRange{0, 3000});
		CHECK_EQ(device->Count("AllocateMemory"), 1);

		// The retained empty page survives until Destroy
		REQUIRE(allocator.Free(ctx, big).IsOK());
		CHECK_EQ(allocator.GetPageCount(0), 1);
		CHECK_EQ(device->GetLiveCount("Memory"), 1);

		allocator.Destroy(ctx);
		CHECK_EQ(device->GetLiveCount("Memory"), 0);
		ctx.Destroy();
	}

	TEST_CASE("Reuses Freed Hole First Fit") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		PageAllocator allocator{PageAllocatorConfig{.page_size = 4096, .retained_empty_pages = 1}};

		auto a = allocator.Allocate(ctx, make_typed_req<HostCoherent>(512, 512)).PopValue();
		auto b = allocator.Allocate(ctx, make_typed_req<HostCoherent>(512, 512)).PopValue();
		REQUIRE(allocator.Free(ctx, a).IsOK());
		auto c = allocator.Allocate(ctx, make_typed_req<HostCoherent>(256, 256)).PopValue();
		CHECK_EQ(c.GetRange(), ByteRange{0, 256});

		REQUIRE(allocator.Free(ctx, b).IsOK());
		REQUIRE(allocator.Free(ctx, c).IsOK());
		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}

	TEST_CASE("Oversized Request Gets Its Own Page") {
		auto device = std::make_shared<MockDevice>();
		Context ctx{device};
		PageAllocator allocator{PageAllocatorConfig{.page_size = 1024, .retained_empty_pages = 0}};

		auto chunk = allocator.Allocate(ctx, make_typed_req<DeviceLocal>(2500, 1)).PopValue();
		const MemoryRaw *raw = ctx.GetStorage().Entry(chunk.GetRaw().index).GetValue();
		CHECK_EQ(raw->size, 3072);

		REQUIRE(allocator.Free(ctx, chunk).IsOK());
		auto again = allocator.Free(ctx, chunk);
		CHECK(again.IsOK());
		allocator.Destroy(ctx);
		ctx.Destroy();
		CHECK_EQ(device->GetLiveCount(), 0);
	}
}
