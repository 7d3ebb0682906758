/**
 * @file config.hpp
 * @brief Public configuration constants and build/target detection macros.
 * @author scottqueue contributors
 * @version 0.1.0
 *
 * This header is standalone and is included by every public queue header.
 *
 * Example:
 * @code
 * // A reclamation manager that scans less often than the default.
 * scottqueue::EBRManager ebr(4 * scottqueue::config::kDefaultReclaimThreshold);
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>

/** @def SCOTTQUEUE_ENABLE_SANITIZERS
 * @brief Build-time toggle indicating sanitizer instrumentation is enabled.
 *
 * This macro is typically provided by CMake. Stress tests use it to scale down their workloads.
 */
#ifndef SCOTTQUEUE_ENABLE_SANITIZERS
#define SCOTTQUEUE_ENABLE_SANITIZERS 0
#endif

/** @def SCOTTQUEUE_PLATFORM_WINDOWS
 * @brief Defined to 1 when building for Windows, otherwise 0.
 */
#if defined(_WIN32) || defined(_WIN64)
#define SCOTTQUEUE_PLATFORM_WINDOWS 1
#else
#define SCOTTQUEUE_PLATFORM_WINDOWS 0
#endif

/** @def SCOTTQUEUE_PLATFORM_LINUX
 * @brief Defined to 1 when building for Linux, otherwise 0.
 */
#if defined(__linux__)
#define SCOTTQUEUE_PLATFORM_LINUX 1
#else
#define SCOTTQUEUE_PLATFORM_LINUX 0
#endif

/** @def SCOTTQUEUE_COMPILER_MSVC
 * @brief Defined to 1 when building with MSVC, otherwise 0.
 */
#if defined(_MSC_VER)
#define SCOTTQUEUE_COMPILER_MSVC 1
#else
#define SCOTTQUEUE_COMPILER_MSVC 0
#endif

/** @def SCOTTQUEUE_COMPILER_CLANG
 * @brief Defined to 1 when building with Clang, otherwise 0.
 */
#if defined(__clang__)
#define SCOTTQUEUE_COMPILER_CLANG 1
#else
#define SCOTTQUEUE_COMPILER_CLANG 0
#endif

/** @def SCOTTQUEUE_COMPILER_GCC
 * @brief Defined to 1 when building with GCC (not Clang), otherwise 0.
 */
#if defined(__GNUC__) && !defined(__clang__)
#define SCOTTQUEUE_COMPILER_GCC 1
#else
#define SCOTTQUEUE_COMPILER_GCC 0
#endif

namespace scottqueue {

/** @brief ABI version for public headers (bumped on breaking changes). */
inline constexpr std::uint32_t kAbiVersion = 0;
/** @brief Whether sanitizers are enabled at build time. */
inline constexpr bool kEnableSanitizers = (SCOTTQUEUE_ENABLE_SANITIZERS != 0);

/** @brief Alignment used to keep head and tail state on separate cache lines. */
inline constexpr std::size_t kCacheLineSize = 64;

namespace config {

/**
 * @brief Number of pending retired nodes that triggers an opportunistic reclamation pass.
 *
 * @note Lower values release memory sooner at the cost of more frequent scans of the registered
 * thread slots.
 */
inline constexpr std::size_t kDefaultReclaimThreshold = 64;

/**
 * @brief Number of (manager, slot) bindings each thread caches.
 *
 * A thread that touches more reclamation managers than this re-registers with the least recently
 * bound one on its next access. The evicted slot is released for reuse.
 */
inline constexpr std::size_t kThreadCacheSize = 8;

}  // namespace config

}  // namespace scottqueue
