#pragma once
#ifndef VKRES_PACKLIST_HPP
#define VKRES_PACKLIST_HPP

#include "MaterialPack.hpp"
#include "MeshPack.hpp"
#include "PipelinePack.hpp"
#include "TypeList.hpp"

#include <optional>

namespace vkres {

// A pack config names its key type, its pack data, and the partial that builds it
template <typename C>
concept PackConfig = requires(const C &config, Context &ctx, uint32_t index) {
	typename C::Key;
	typename C::Data;
	typename C::Partial;
	{ config.IsEmpty() } -> std::convertible_to<bool>;
	{ C::Partial::Prepare(ctx, index, config) } -> std::same_as<ResourceResult<typename C::Partial>>;
};

namespace _details_pack_list_ {

template <typename Configs> struct Traits;
template <> struct Traits<Nil> {
	using Partials = Nil;
	using Packs = Nil;
};
template <PackConfig C, typename Tail> struct Traits<Cons<C, Tail>> {
	using Partials = Cons<std::optional<typename C::Partial>, typename Traits<Tail>::Partials>;
	using Packs = Cons<std::optional<Pack<typename C::Key, typename C::Data>>, typename Traits<Tail>::Packs>;
};

inline ResourceResult<void> prepare(Context &, const Nil &, Nil &, uint32_t) { return {}; }
template <typename C, typename CTail, typename PTail>
inline ResourceResult<void> prepare(Context &ctx, const Cons<C, CTail> &configs,
                                    Cons<std::optional<typename C::Partial>, PTail> &partials, uint32_t index) {
	if (!configs.head.IsEmpty()) {
		auto result = C::Partial::Prepare(ctx, index, configs.head);
		if (result.IsError())
			return result.PopError();
		partials.head.emplace(result.PopValue());
	}
	return prepare(ctx, configs.tail, partials.tail, index + 1);
}

inline ResourceResult<void> finalize(Context &, Allocator &, Nil &, Nil &) { return {}; }
template <typename P, typename PTail, typename K, typename KTail>
inline ResourceResult<void> finalize(Context &ctx, Allocator &allocator, Cons<std::optional<P>, PTail> &partials,
                                     Cons<std::optional<K>, KTail> &packs) {
	if (partials.head) {
		auto result = std::move(*partials.head).Finalize(ctx, allocator);
		partials.head.reset();
		if (result.IsError())
			return result.PopError();
		packs.head.emplace(result.PopValue());
	}
	return finalize(ctx, allocator, partials.tail, packs.tail);
}

template <typename List> inline void destroy_partials(Context &ctx, List &partials) {
	ForEachReverse(partials, [&ctx](auto &partial) {
		if (partial)
			std::move(*partial).Destroy(ctx);
		partial.reset();
	});
}

template <typename List> inline ResourceResult<void> destroy_packs(Context &ctx, Allocator &allocator, List &packs) {
	std::optional<ResourceError> first_error;
	ForEachReverse(packs, [&](auto &pack) {
		if (!pack)
			return;
		auto result = pack->Destroy(ctx, allocator);
		if (result.IsError() && !first_error)
			first_error = result.PopError();
		pack.reset();
	});
	if (first_error)
		return *first_error;
	return {};
}

} // namespace _details_pack_list_

template <typename Configs> class PackList;

// Prepared but unbound packs for every config of a Cons list. Empty configs produce no pack.
template <typename Configs> class PackListPartial {
private:
	using Partials = typename _details_pack_list_::Traits<Configs>::Partials;
	Partials m_partials{};
	bool m_live{false};

public:
	inline PackListPartial() = default;
	inline PackListPartial(PackListPartial &&other) noexcept
	    : m_partials{std::move(other.m_partials)}, m_live{std::exchange(other.m_live, false)} {}
	PackListPartial(const PackListPartial &) = delete;
	PackListPartial &operator=(const PackListPartial &) = delete;
	inline ~PackListPartial() { assert(!m_live && "PackListPartial dropped without Finalize or Destroy"); }

	static inline ResourceResult<PackListPartial> Prepare(Context &ctx, const Configs &configs) {
		PackListPartial partial;
		auto result = _details_pack_list_::prepare(ctx, configs, partial.m_partials, 0);
		if (result.IsError()) {
			_details_pack_list_::destroy_partials(ctx, partial.m_partials);
			return result.PopError();
		}
		partial.m_live = true;
		return partial;
	}

	// Every memory request the finalize step will make, in the order it will make them
	inline std::vector<AllocReqRaw> Requirements() const {
		std::vector<AllocReqRaw> reqs;
		ForEach(m_partials, [&reqs](const auto &partial) {
			if (!partial)
				return;
			auto partial_reqs = partial->Requirements();
			reqs.insert(reqs.end(), partial_reqs.begin(), partial_reqs.end());
		});
		return reqs;
	}

	// On failure every pack built so far and every remaining partial is destroyed
	inline ResourceResult<PackList<Configs>> Finalize(Context &ctx, Allocator &allocator) && {
		assert(m_live);
		m_live = false;
		PackList<Configs> list;
		auto result = _details_pack_list_::finalize(ctx, allocator, m_partials, list.m_packs);
		if (result.IsError()) {
			_details_pack_list_::destroy_partials(ctx, m_partials);
			VKRES_CLEANUP(list.Destroy(ctx, allocator));
			return result.PopError();
		}
		return list;
	}

	inline void Destroy(Context &ctx) && {
		_details_pack_list_::destroy_partials(ctx, m_partials);
		m_live = false;
	}
};

// One optional pack per config, keyed by static type
template <typename Configs> class PackList {
private:
	using Packs = typename _details_pack_list_::Traits<Configs>::Packs;
	Packs m_packs{};

	template <typename> friend class PackListPartial;

public:
	inline PackList() = default;

	static inline ResourceResult<PackList> Load(Context &ctx, Allocator &allocator, const Configs &configs) {
		auto partial_result = PackListPartial<Configs>::Prepare(ctx, configs);
		if (partial_result.IsError())
			return partial_result.PopError();
		return partial_result.PopValue().Finalize(ctx, allocator);
	}

	inline static constexpr std::size_t kLength = vkres::kLength<Packs>;

	// Scans the nodes in order for the first pack of kind Key stored as Data
	template <typename Key, typename Data> inline std::optional<PackRef<Key, Data>> TryGet() const {
		std::optional<PackRef<Key, Data>> ret;
		ForEach(m_packs, [&ret](const auto &node) {
			using Node = std::decay_t<decltype(node)>;
			if constexpr (std::is_same_v<Node, std::optional<Pack<Key, Data>>>) {
				if (!ret && node)
					ret = node->GetRef();
			}
		});
		return ret;
	}
	template <typename V> inline std::optional<PackRef<V, MeshPackData>> TryGetMeshes() const {
		return TryGet<V, MeshPackData>();
	}
	template <typename M> inline std::optional<PackRef<M, MaterialPackData>> TryGetMaterials() const {
		return TryGet<M, MaterialPackData>();
	}
	template <typename S> inline std::optional<PackRef<S, PipelinePackData>> TryGetPipelines() const {
		return TryGet<S, PipelinePackData>();
	}

	// Moves every pack stored as Data into a flat erased list
	template <typename Data> inline PackTypeErasedList<Data> TakeErased() {
		PackTypeErasedList<Data> list;
		ForEach(m_packs, [&list](auto &node) {
			using Node = std::decay_t<decltype(node)>;
			using PackT = typename Node::value_type;
			if constexpr (std::is_same_v<std::decay_t<decltype(std::declval<const PackT &>().GetData())>, Data>) {
				if (node) {
					list.Push(std::move(*node));
					node.reset();
				}
			}
		});
		return list;
	}

	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) {
		return _details_pack_list_::destroy_packs(ctx, allocator, m_packs);
	}
};

} // namespace vkres

#endif
