// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON-like immutable Value tree used as the snapshot format.
///
/// A Value holds one of: null, bool, int64, double, string, map (string keys)
/// or vector. Maps and vectors are immer persistent containers, so copying a
/// snapshot is O(1) and an updated snapshot shares structure with the old one.
///
/// Usage:
/// @code
///   Value p = Value::map({{"x", Value{1.0}}, {"y", Value{2.0}}});
///   Value q = p.set("x", Value{5.0});     // p is unchanged
///   double x = q.at("x").as_number();
/// @endcode

#pragma once

#include "geo_nodes_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace geo_nodes {

namespace detail {

// Diagnostics, compiled in when GEO_NODES_VERBOSE_LOG is non-zero:
//   [func] message (called from file:line)
GEO_NODES_API void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept;

GEO_NODES_API void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept;

/// Shortest round-trip text of v, always with a '.' or exponent ("10.0")
[[nodiscard]] GEO_NODES_API std::string format_double(double v);

} // namespace detail

/// Non-atomic refcounts, no locks; snapshots never cross threads
using memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

class Value;

using ValueBox    = immer::box<Value, memory_policy>;
using ValueMap    = immer::map<std::string, ValueBox,
                               std::hash<std::string>, std::equal_to<std::string>,
                               memory_policy>;
using ValueVector = immer::vector<ValueBox, memory_policy>;

/// One step of a Path: a map key or a vector index
using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

class GEO_NODES_API Value
{
public:
    using Data = std::variant<std::monostate,
                              bool,
                              int64_t,
                              double,
                              std::string,
                              ValueMap,
                              ValueVector>;

    Data data;

    Value() noexcept = default;

    // Every integral type except bool is stored as int64_t
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    Value(bool v) noexcept : data(v) {}
    Value(std::string v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::string{v}) {}
    Value(ValueMap v) noexcept : data(std::move(v)) {}
    Value(ValueVector v) noexcept : data(std::move(v)) {}

    [[nodiscard]] static Value map(std::initializer_list<std::pair<std::string, Value>> entries);
    [[nodiscard]] static Value vector(std::initializer_list<Value> items);

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }

    /// Child by key; nullptr if this is not a map or the key is absent
    [[nodiscard]] const Value* find(const std::string& key) const;

    /// Child by key or index; null Value (and a diagnostic) when absent
    [[nodiscard]] Value at(const std::string& key) const;
    [[nodiscard]] Value at(std::size_t index) const;

    /// Typed read with fallback. Integral T reads the int64 alternative,
    /// floating-point T reads the double alternative.
    template <typename T>
    [[nodiscard]] T as(T fallback = T{}) const {
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            const auto* p = get_if<int64_t>();
            return p ? static_cast<T>(*p) : fallback;
        } else if constexpr (std::is_floating_point_v<T>) {
            const auto* p = get_if<double>();
            return p ? static_cast<T>(*p) : fallback;
        } else {
            const auto* p = get_if<T>();
            return p ? *p : fallback;
        }
    }

    /// Either numeric alternative, as double
    [[nodiscard]] double as_number(double fallback = 0.0) const noexcept;

    [[nodiscard]] std::string as_string(std::string fallback = {}) const;
    [[nodiscard]] std::string_view as_string_view() const noexcept;

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    /// Entries of a map or vector; 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept;

    /// Map keys in ascending order (empty for non-maps)
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Copy with key set; a null Value becomes a one-entry map
    [[nodiscard]] Value set(const std::string& key, Value val) const;

    friend bool operator==(const Value& a, const Value& b) { return a.data == b.data; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }
};

/// Short human-readable form; containers are summarized ("{map:3}")
[[nodiscard]] GEO_NODES_API std::string value_to_string(const Value& val);

/// Dot notation, e.g. ".nodes[0].x"; "/" for the empty path
[[nodiscard]] GEO_NODES_API std::string path_to_string(const Path& path);

} // namespace geo_nodes
