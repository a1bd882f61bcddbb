#pragma once
#ifndef VKRES_TYPELIST_HPP
#define VKRES_TYPELIST_HPP

#include <cstddef>
#include <type_traits>
#include <utility>

namespace vkres {

// Heterogeneous list: Nil terminates, Cons<Head, Tail> prepends one typed value
struct Nil {};
template <typename H, typename T> struct Cons {
	using Head = H;
	using Tail = T;
	Head head;
	Tail tail;
};

namespace _details_type_list_ {
template <typename List> struct Length;
template <> struct Length<Nil> : std::integral_constant<std::size_t, 0> {};
template <typename H, typename T> struct Length<Cons<H, T>> : std::integral_constant<std::size_t, 1 + Length<T>::value> {};

template <typename List, typename Item> struct Append;
template <typename Item> struct Append<Nil, Item> {
	using Type = Cons<Item, Nil>;
};
template <typename H, typename T, typename Item> struct Append<Cons<H, T>, Item> {
	using Type = Cons<H, typename Append<T, Item>::Type>;
};

template <typename... Items> struct Make;
template <> struct Make<> {
	using Type = Nil;
};
template <typename H, typename... Rest> struct Make<H, Rest...> {
	using Type = Cons<H, typename Make<Rest...>::Type>;
};

template <typename List, typename Item> inline constexpr bool kContains = false;
template <typename H, typename T, typename Item>
inline constexpr bool kContains<Cons<H, T>, Item> = std::is_same_v<H, Item> || kContains<T, Item>;
} // namespace _details_type_list_

template <typename List> inline constexpr std::size_t kLength = _details_type_list_::Length<List>::value;
template <typename List, typename Item> using Append = typename _details_type_list_::Append<List, Item>::Type;
template <typename... Items> using MakeList = typename _details_type_list_::Make<Items...>::Type;

template <typename List, typename Item>
concept Contains = _details_type_list_::kContains<List, Item>;

// Value-level Append
template <typename Item> inline Cons<std::decay_t<Item>, Nil> PushBack(Nil, Item &&item) {
	return {std::forward<Item>(item), Nil{}};
}
template <typename H, typename T, typename Item>
inline Append<Cons<H, T>, std::decay_t<Item>> PushBack(Cons<H, T> &&list, Item &&item) {
	return {std::move(list.head), PushBack(std::move(list.tail), std::forward<Item>(item))};
}

// Lookup of the one node holding Item
template <typename Item, typename H, typename T>
requires Contains<Cons<H, T>, Item>
inline Item &Get(Cons<H, T> &list) {
	if constexpr (std::is_same_v<H, Item>)
		return list.head;
	else
		return Get<Item>(list.tail);
}
template <typename Item, typename H, typename T>
requires Contains<Cons<H, T>, Item>
inline const Item &Get(const Cons<H, T> &list) {
	if constexpr (std::is_same_v<H, Item>)
		return list.head;
	else
		return Get<Item>(list.tail);
}

template <typename Func> inline void ForEach(Nil &, Func &&) {}
template <typename Func> inline void ForEach(const Nil &, Func &&) {}
template <typename H, typename T, typename Func> inline void ForEach(Cons<H, T> &list, Func &&func) {
	func(list.head);
	ForEach(list.tail, func);
}
template <typename H, typename T, typename Func> inline void ForEach(const Cons<H, T> &list, Func &&func) {
	func(list.head);
	ForEach(list.tail, func);
}

// Tail first, for teardown in reverse of construction
template <typename Func> inline void ForEachReverse(Nil &, Func &&) {}
template <typename H, typename T, typename Func> inline void ForEachReverse(Cons<H, T> &list, Func &&func) {
	ForEachReverse(list.tail, func);
	func(list.head);
}

} // namespace vkres

#endif
