// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text rendering and parsing for Value snapshots.
///
/// Usage:
/// @code
///   Value data = Value::map({{"x", Value{1.0}}});
///   std::string text = to_json(data);           // pretty-printed
///   std::string error;
///   Value parsed = from_json(text, &error);     // null + error on failure
/// @endcode
///
/// Format notes:
/// - Map keys are written in ascending order, so equal Values render identically
/// - Doubles use the shortest text that reads back exactly and always carry a
///   '.' or an exponent ("10.0"); integers never do. Parsing restores the
///   same alternative.
/// - NaN and infinities have no JSON form; to_json throws SerializationError
/// - \\u escapes are decoded to UTF-8; surrogate pairs must be complete
/// - Nesting deeper than max_json_depth is rejected

#pragma once

#include "api.h"
#include "value.h"

#include <cstddef>
#include <string>

namespace geo_nodes {

/// Deepest accepted nesting of objects and arrays in from_json()
inline constexpr std::size_t max_json_depth = 256;

/// @param compact If true, no whitespace; otherwise two-space indentation
/// @throws SerializationError if the tree contains a non-finite double
[[nodiscard]] GEO_NODES_API std::string to_json(const Value& val, bool compact = false);

/// @param error_out If provided, receives "<reason> at offset <n>" on failure
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] GEO_NODES_API Value from_json(const std::string& text, std::string* error_out = nullptr);

} // namespace geo_nodes
