#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: RC_COMPILER_MSVC, RC_COMPILER_CLANG, RC_COMPILER_GCC, RC_COMPILER_POSIX

#if defined(_MSC_VER)
#define RC_COMPILER_MSVC
#elif defined(__clang__)
#define RC_COMPILER_CLANG
#elif defined(__GNUC__)
#define RC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(RC_COMPILER_CLANG) || defined(RC_COMPILER_GCC)
#define RC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: RC_HAS_CPP_EXCEPTIONS
// From CMake: RC_DEBUG, RC_RELEASE, RC_RELWITHDEBINFO, RC_ENABLE_ASSERT_IN_RELEASE

#ifdef RC_COMPILER_MSVC
#ifdef _CPPUNWIND
#define RC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(RC_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define RC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(RC_COMPILER_GCC)
#if __EXCEPTIONS
#define RC_HAS_CPP_EXCEPTIONS
#endif
#endif

// RC_ASSERT_ENABLED - 1 if RC_ASSERT is checked at runtime, 0 if it is compiled out
// Builds without any configuration define are treated like debug builds.
#if defined(RC_RELEASE) && !defined(RC_ENABLE_ASSERT_IN_RELEASE)
#define RC_ASSERT_ENABLED 0
#else
#define RC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// RC_FORCE_INLINE - Force function to be inlined
#define RC_FORCE_INLINE RC_IMPL_FORCE_INLINE

// RC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: RC_COLD_FUNC void handle_error() { ... }
#define RC_COLD_FUNC RC_IMPL_COLD_FUNC

// RC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define RC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(RC_COMPILER_MSVC)

#define RC_IMPL_FORCE_INLINE __forceinline
#define RC_IMPL_COLD_FUNC

#elif defined(RC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define RC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define RC_IMPL_COLD_FUNC __attribute__((cold))

#endif
