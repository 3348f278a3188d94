#pragma once

#ifndef __META_HPP
#define __META_HPP

#include <tuple>
#include <utility>
#include <type_traits>

// compile-time member registration for plain config structs:
//
// template <> inline auto meta::register_members<some_config_t>() {
//     return make_members(
//         make_member("port", 0, &some_config_t::port),
//         make_member("host", 1, &some_config_t::host)
//     );
// }
//
// the id is an index into a description table kept beside the struct

namespace meta {

template<class... Ts> struct overload : Ts... { using Ts::operator()...; };
template<class... Ts> overload(Ts...) -> overload<Ts...>;

// function used for registration of structs by user
template <typename T> inline auto register_members() { return std::make_tuple(); }

namespace detail {
template <typename F, typename... Args, std::size_t... Idx>
void for_tuple_impl(F&& f, const std::tuple<Args...>& tuple, std::index_sequence<Idx...>) { (f(std::get<Idx>(tuple)), ...); }
// call f for each element from tuple
template <typename F, typename... Args> void for_tuple(F&& f, const std::tuple<Args...>& tuple) { for_tuple_impl(f, tuple, std::index_sequence_for<Args...>{}); }
template <typename F> void for_tuple(F&& /* f */, const std::tuple<>& /* tuple */) { }
// holds the members tuple built once by register_members<T>
template <typename T, typename TupleType>
struct meta_holder {
    static inline TupleType members = register_members<T>();
};
} // end of namespace detail

template <typename T, typename M>
using member_ptr_t = M T::*;

template <typename T, typename M>
struct member {
    using struct_t = T;
    using member_t = M;

    member(const char* name, int id, member_ptr_t<T, M> ptr) : name(name), id(id), ptr(ptr) {}

    const M& get(const T& obj) const { return obj.*ptr; }
    M& get_ref(T& obj) const { return obj.*ptr; }
    template <typename V, typename = std::enable_if_t<std::is_constructible_v<M, V>>>
    void set(T& obj, V&& value) const { obj.*ptr = std::forward<V>(value); }

    int get_id() const { return id; }
    const char* get_name() const { return name; }

private:
    const char* name{ nullptr };
    int id{ 0 };
    member_ptr_t<T, M> ptr{ nullptr };
};

// MT is member<T, M>
template <typename MT>
using get_member_type = typename std::decay_t<MT>::member_t;

template <typename T, typename M> member<T, M> make_member(const char* name, const int id, M T::* ptr) { return member<T, M>(name, id, ptr); }

template <typename... Args> auto make_members(Args&&... args) { return std::make_tuple(std::forward<Args>(args)...); }

// returns std::tuple of members
template <typename T> const auto& get_members() { return detail::meta_holder<T, decltype(register_members<T>())>::members; }
// returns the number of registered members of the struct T
template <typename T> constexpr std::size_t get_member_count() { return std::tuple_size_v<decltype(register_members<T>())>; }
// check if struct T has register_members<T> specialization
template <typename T> constexpr bool is_registered() { return !std::is_same_v<std::tuple<>, decltype(register_members<T>())>; }

template <typename T, typename F>
void do_for_all_members(F&& f) {
    if constexpr (is_registered<T>())
        detail::for_tuple(std::forward<F>(f), get_members<T>());
}

} // end of namespace meta

#endif // #ifndef __META_HPP
