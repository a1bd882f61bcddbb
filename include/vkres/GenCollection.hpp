#pragma once
#ifndef VKRES_GENCOLLECTION_HPP
#define VKRES_GENCOLLECTION_HPP

#include "Error.hpp"

#include <cassert>
#include <cinttypes>
#include <optional>
#include <utility>
#include <vector>

namespace vkres {

// Slot position plus the generation the slot had when the value was pushed
template <typename T> struct GenIndex {
	uint32_t index{UINT32_MAX}, generation{0};

	inline bool IsNull() const { return index == UINT32_MAX; }
	inline bool operator==(const GenIndex &) const = default;
};

template <typename T> inline constexpr const char *kGenCollectionKind = "Item";
template <typename T>
requires requires { T::kName; }
inline constexpr const char *kGenCollectionKind<T> = T::kName;

template <typename T> class GenCollection {
private:
	struct Cell {
		uint32_t generation{0};
		std::optional<T> value;
	};
	std::vector<Cell> m_cells;
	std::vector<uint32_t> m_vacant;

	inline static constexpr const char *kKind = kGenCollectionKind<T>;

	inline ArenaResult<Cell *> get_cell(const GenIndex<T> &index) {
		if (index.index >= m_cells.size())
			return error::InvalidIndex{index.index, m_cells.size(), kKind};
		Cell &cell = m_cells[index.index];
		if (cell.generation != index.generation)
			return error::StaleIndex{index.index, index.generation, cell.generation, kKind};
		if (!cell.value)
			return error::EmptySlot{index.index, kKind};
		return &cell;
	}

public:
	inline GenCollection() = default;
	inline GenCollection(GenCollection &&) noexcept = default;
	inline GenCollection &operator=(GenCollection &&) noexcept = default;
	GenCollection(const GenCollection &) = delete;
	GenCollection &operator=(const GenCollection &) = delete;

	inline GenIndex<T> Push(T value) {
		uint32_t index;
		if (m_vacant.empty()) {
			index = m_cells.size();
			m_cells.emplace_back();
		} else {
			index = m_vacant.back();
			m_vacant.pop_back();
		}
		Cell &cell = m_cells[index];
		assert(!cell.value);
		cell.value = std::move(value);
		return {index, cell.generation};
	}

	inline ArenaResult<T> Pop(const GenIndex<T> &index) {
		auto cell_result = get_cell(index);
		if (cell_result.IsError())
			return cell_result.PopError();
		Cell *cell = cell_result.PopValue();
		T value = std::move(*cell->value);
		cell->value.reset();
		++cell->generation;
		m_vacant.push_back(index.index);
		return value;
	}

	inline ArenaResult<const T *> Entry(const GenIndex<T> &index) const {
		auto cell_result = const_cast<GenCollection *>(this)->get_cell(index);
		if (cell_result.IsError())
			return cell_result.PopError();
		return static_cast<const T *>(&*cell_result.PopValue()->value);
	}
	inline ArenaResult<T *> EntryMut(const GenIndex<T> &index) {
		auto cell_result = get_cell(index);
		if (cell_result.IsError())
			return cell_result.PopError();
		return &*cell_result.PopValue()->value;
	}

	inline bool IsValid(const GenIndex<T> &index) const { return Entry(index).IsOK(); }
	inline std::size_t GetSize() const { return m_cells.size() - m_vacant.size(); }
	inline bool IsEmpty() const { return GetSize() == 0; }

	// Removes every live value in slot order, handing each to func
	template <typename Func> inline void Drain(Func &&func) {
		for (uint32_t i = 0; i < m_cells.size(); ++i) {
			Cell &cell = m_cells[i];
			if (!cell.value)
				continue;
			T value = std::move(*cell.value);
			cell.value.reset();
			++cell.generation;
			m_vacant.push_back(i);
			func(std::move(value));
		}
	}
};

} // namespace vkres

#endif
