#include "vkres/ResourceStorage.hpp"

#include <cstdio>

namespace vkres {

void ResourceStorage::Destroy(const Device &device) {
	assert(!m_destroyed && "ResourceStorage destroyed twice");
	if (m_destroyed)
		return;
	std::size_t leaked = 0;
	ForEach(m_collections, [&device, &leaked](auto &collection) {
		leaked += collection.GetSize();
		collection.Drain([&device](const auto &raw) { raw.Destroy(device); });
	});
	if (leaked)
		fprintf(stderr, "vkres: destroyed %zu resources still held by the arena\n", leaked);
	m_destroyed = true;
}

} // namespace vkres
