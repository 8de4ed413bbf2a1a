// api.h - DLL export/import macros for jsonrfc

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the jsonrfc library.
///
/// Usage:
/// - When building jsonrfc as a SHARED library:
///   - CMake defines JSONRFC_EXPORTS (private) and JSONRFC_SHARED (public)
///   - Functions marked with JSONRFC_API are exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSONRFC_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSONRFC_SHARED
        #ifdef JSONRFC_EXPORTS
            #define JSONRFC_API __declspec(dllexport)
        #else
            #define JSONRFC_API __declspec(dllimport)
        #endif
    #else
        #define JSONRFC_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSONRFC_SHARED) && defined(JSONRFC_EXPORTS)
        #define JSONRFC_API __attribute__((visibility("default")))
    #else
        #define JSONRFC_API
    #endif
#else
    #define JSONRFC_API
#endif

// For explicit template instantiation in shared libraries
#ifdef _MSC_VER
    #define JSONRFC_EXTERN_TEMPLATE extern template
    #define JSONRFC_EXPORT_TEMPLATE template struct JSONRFC_API
#else
    #define JSONRFC_EXTERN_TEMPLATE extern template
    #define JSONRFC_EXPORT_TEMPLATE template struct
#endif
