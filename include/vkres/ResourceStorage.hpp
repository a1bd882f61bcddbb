#pragma once
#ifndef VKRES_RESOURCESTORAGE_HPP
#define VKRES_RESOURCESTORAGE_HPP

#include "GenCollection.hpp"
#include "Resource.hpp"
#include "TypeList.hpp"

namespace vkres {

template <typename R> using ResourceIndex = GenIndex<R>;

class ResourceStorage {
private:
	// Ordered by teardown: views reference images, images and buffers reference memory
	using Collections = MakeList<GenCollection<ImageViewRaw>, GenCollection<ImageRaw>, GenCollection<BufferRaw>,
	                             GenCollection<MemoryRaw>>;
	Collections m_collections;
	bool m_destroyed{false};

public:
	template <typename R> inline static constexpr bool kStores = Contains<Collections, GenCollection<R>>;

	inline ResourceStorage() = default;
	inline ResourceStorage(ResourceStorage &&other) noexcept
	    : m_collections{std::move(other.m_collections)}, m_destroyed{std::exchange(other.m_destroyed, true)} {}
	ResourceStorage(const ResourceStorage &) = delete;
	ResourceStorage &operator=(const ResourceStorage &) = delete;
	inline ~ResourceStorage() { assert((m_destroyed || IsEmpty()) && "ResourceStorage dropped with live resources"); }

	template <typename R>
	requires kStores<R>
	inline ResourceIndex<R> Insert(R raw) {
		assert(!m_destroyed);
		return Get<GenCollection<R>>(m_collections).Push(std::move(raw));
	}
	// Removes the entry without touching the device object
	template <typename R>
	requires kStores<R>
	inline ArenaResult<R> Remove(const ResourceIndex<R> &index) {
		return Get<GenCollection<R>>(m_collections).Pop(index);
	}
	// Removes the entry and destroys its device object
	template <typename R>
	requires kStores<R>
	inline ArenaResult<void> Destroy(const Device &device, const ResourceIndex<R> &index) {
		auto result = Remove(index);
		if (result.IsError())
			return result.PopError();
		result.GetValue().Destroy(device);
		return {};
	}
	template <typename R>
	requires kStores<R>
	inline ArenaResult<const R *> Entry(const ResourceIndex<R> &index) const {
		return Get<GenCollection<R>>(m_collections).Entry(index);
	}
	template <typename R>
	requires kStores<R>
	inline ArenaResult<R *> EntryMut(const ResourceIndex<R> &index) {
		return Get<GenCollection<R>>(m_collections).EntryMut(index);
	}
	template <typename R>
	requires kStores<R>
	inline std::size_t GetCount() const {
		return Get<GenCollection<R>>(m_collections).GetSize();
	}

	inline bool IsEmpty() const {
		bool empty = true;
		ForEach(m_collections, [&empty](const auto &collection) { empty = empty && collection.IsEmpty(); });
		return empty;
	}
	inline bool IsDestroyed() const { return m_destroyed; }

	// Destroys every remaining device object, views first and memory last. Must run exactly once.
	void Destroy(const Device &device);
};

// Everything a resource operation needs: the device and the arena holding its raw objects
class Context {
private:
	Ptr<Device> m_device_ptr;
	ResourceStorage m_storage;

public:
	inline explicit Context(Ptr<Device> device) : m_device_ptr{std::move(device)} {}

	inline const Ptr<Device> &GetDevicePtr() const { return m_device_ptr; }
	inline const Device &GetDevice() const { return *m_device_ptr; }
	inline ResourceStorage &GetStorage() { return m_storage; }
	inline const ResourceStorage &GetStorage() const { return m_storage; }

	inline void Destroy() { m_storage.Destroy(*m_device_ptr); }
};

} // namespace vkres

#endif
