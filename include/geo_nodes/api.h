// api.h - Shared library export/import macros for geo_nodes

#pragma once

/// @file api.h
/// @brief Cross-platform symbol visibility macros for the geo_nodes library.
///
/// Usage:
/// - When building geo_nodes as a SHARED library:
///   - CMake defines GEO_NODES_EXPORTS (private) and GEO_NODES_SHARED (public)
///   - Functions/classes marked with GEO_NODES_API will be exported
///
/// - When using geo_nodes as a SHARED library:
///   - Link against the geo_nodes target (CMake propagates GEO_NODES_SHARED)
///
/// - When building/using as a STATIC library:
///   - GEO_NODES_API expands to nothing
///
/// Example:
/// @code
/// class GEO_NODES_API NodeCollection { ... };
/// GEO_NODES_API std::string to_json(const Value& val, bool compact);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef GEO_NODES_SHARED
        #ifdef GEO_NODES_EXPORTS
            #define GEO_NODES_API __declspec(dllexport)
        #else
            #define GEO_NODES_API __declspec(dllimport)
        #endif
    #else
        #define GEO_NODES_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(GEO_NODES_SHARED) && defined(GEO_NODES_EXPORTS)
        #define GEO_NODES_API __attribute__((visibility("default")))
    #else
        #define GEO_NODES_API
    #endif
#else
    #define GEO_NODES_API
#endif
