#pragma once
#ifndef VKRES_PACK_HPP
#define VKRES_PACK_HPP

#include "Allocator.hpp"
#include "Handle.hpp"

#include <optional>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace vkres {

template <typename Data>
concept PackData = std::default_initializable<Data> && std::movable<Data> &&
                   requires(const Data &data, Data &mut_data, Context &ctx, Allocator &allocator) {
	                   { data.GetItemCount() } -> std::convertible_to<std::size_t>;
	                   { mut_data.Destroy(ctx, allocator) } -> std::same_as<ResourceResult<void>>;
                   };

// Non-owning view of a pack with its static kind T restored
template <typename T, PackData Data> class PackRef {
private:
	uint32_t m_index;
	const Data *m_data;

public:
	inline PackRef(uint32_t index, const Data &data) : m_index{index}, m_data{&data} {}

	inline uint32_t GetIndex() const { return m_index; }
	inline const Data &GetData() const { return *m_data; }
	inline std::size_t GetItemCount() const { return m_data->GetItemCount(); }
	inline auto GetItem(std::size_t item) const {
		assert(item < GetItemCount());
		return m_data->template GetItem<T>(item);
	}
	// Checked lookup for item indices from outside the pack, such as decoded handles
	inline auto TryGetItem(std::size_t item) const -> ResourceResult<decltype(m_data->template GetItem<T>(0))> {
		if (item >= GetItemCount())
			return error::InvalidIndex{item, GetItemCount(), "Pack item"};
		return m_data->template GetItem<T>(item);
	}
	inline Handle<T, Data> GetHandle(uint32_t item) const { return {m_index, item}; }
};

// Items of one static kind T sharing the storage described by Data
template <typename T, PackData Data> class Pack {
private:
	uint32_t m_index{0};
	Data m_data{};

public:
	inline Pack() = default;
	inline Pack(uint32_t index, Data data) : m_index{index}, m_data{std::move(data)} {}

	inline uint32_t GetIndex() const { return m_index; }
	inline const Data &GetData() const { return m_data; }
	inline PackRef<T, Data> GetRef() const { return {m_index, m_data}; }
	inline std::size_t GetItemCount() const { return m_data.GetItemCount(); }
	inline auto GetItem(std::size_t item) const {
		assert(item < GetItemCount());
		return m_data.template GetItem<T>(item);
	}

	inline Data Release() && { return std::move(m_data); }

	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) { return m_data.Destroy(ctx, allocator); }
};

// A pack whose kind is only known at runtime. Recovering the static kind is always checked against the stored tag.
template <PackData Data> class PackTypeErased {
private:
	std::type_index m_type;
	uint32_t m_index;
	Data m_data;

	template <typename T> inline error::InvalidType type_error() const {
		return {typeid(T).name(), m_type.name()};
	}

public:
	template <typename T>
	inline explicit PackTypeErased(Pack<T, Data> &&pack)
	    : m_type{typeid(T)}, m_index{pack.GetIndex()}, m_data{std::move(pack).Release()} {}

	inline std::type_index GetType() const { return m_type; }
	inline uint32_t GetIndex() const { return m_index; }
	inline const Data &GetData() const { return m_data; }
	inline std::size_t GetItemCount() const { return m_data.GetItemCount(); }
	template <typename T> inline bool Is() const { return m_type == std::type_index{typeid(T)}; }

	template <typename T> inline ResourceResult<PackRef<T, Data>> Downcast() const {
		if (!Is<T>())
			return type_error<T>();
		return PackRef<T, Data>{m_index, m_data};
	}
	// Moves the data back into a typed pack; on a tag mismatch this is left untouched
	template <typename T> inline ResourceResult<Pack<T, Data>> Into() && {
		if (!Is<T>())
			return type_error<T>();
		return Pack<T, Data>{m_index, std::move(m_data)};
	}

	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) { return m_data.Destroy(ctx, allocator); }
};

// Flat list of erased packs of one storage layout
template <PackData Data> class PackTypeErasedList {
private:
	std::vector<PackTypeErased<Data>> m_packs;

public:
	inline void Push(PackTypeErased<Data> &&pack) { m_packs.push_back(std::move(pack)); }
	template <typename T> inline void Push(Pack<T, Data> &&pack) { m_packs.emplace_back(std::move(pack)); }

	inline std::size_t GetSize() const { return m_packs.size(); }
	inline const std::vector<PackTypeErased<Data>> &GetPacks() const { return m_packs; }

	// First pack that downcasts to T
	template <typename T> inline std::optional<PackRef<T, Data>> TryGet() const {
		for (const auto &pack : m_packs) {
			auto result = pack.template Downcast<T>();
			if (result.IsOK())
				return result.PopValue();
		}
		return std::nullopt;
	}
	template <typename T> inline ResourceResult<PackRef<T, Data>> Get(uint32_t pack_index) const {
		for (const auto &pack : m_packs)
			if (pack.GetIndex() == pack_index)
				return pack.template Downcast<T>();
		return error::InvalidIndex{pack_index, m_packs.size(), "Pack"};
	}
	template <typename T> inline auto GetItem(const Handle<T, Data> &handle) const
	    -> ResourceResult<decltype(std::declval<const Data &>().template GetItem<T>(0))> {
		auto pack_result = Get<T>(handle.pack);
		if (pack_result.IsError())
			return pack_result.PopError();
		return pack_result.GetValue().TryGetItem(handle.item);
	}

	// Destroys every pack, most recently pushed first, and reports the first failure
	inline ResourceResult<void> Destroy(Context &ctx, Allocator &allocator) {
		std::optional<ResourceError> first_error;
		for (auto it = m_packs.rbegin(); it != m_packs.rend(); ++it) {
			auto result = it->Destroy(ctx, allocator);
			if (result.IsError() && !first_error)
				first_error = result.PopError();
		}
		m_packs.clear();
		if (first_error)
			return *first_error;
		return {};
	}
};

} // namespace vkres

#endif
