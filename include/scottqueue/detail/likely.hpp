#pragma once

#include <scottqueue/config.hpp>

// Branch prediction hints for the CAS retry loops (no behavioral change).
#if defined(__clang__) || defined(__GNUC__)
#define SCOTTQUEUE_LIKELY(x) (__builtin_expect(!!(x), 1))
#define SCOTTQUEUE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define SCOTTQUEUE_LIKELY(x) (!!(x))
#define SCOTTQUEUE_UNLIKELY(x) (!!(x))
#endif
