#pragma once

#include <cstddef>

#if defined(EXGROUP_DLL_EXPORT)
#define EXGROUP_API __declspec(dllexport)
#elif defined(EXGROUP_DLL_IMPORT)
#define EXGROUP_API __declspec(dllimport)
#elif defined(EXGROUP_LIB_VISIBILITY) && defined(__GNUC__) && (__GNUC__ >= 4)
#define EXGROUP_API __attribute__((visibility("default")))
#else
#define EXGROUP_API
#endif  // defined(EXGROUP_DLL_EXPORT)

#define EXGROUP_NON_COPYABLE(type)                                                \
    type(const type&) = delete;                                                   \
    type(type&&) = delete;                 /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(const type&) = delete; /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(type&&) = delete;      /*NOLINT(bugprone-macro-parentheses)*/

#define EXGROUP_COPYABLE_DEFAULT(type)                                                 \
    type(const type&) = default;                                                       \
    type(type&&) noexcept = default;            /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(const type&) = default;     /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(type&&) noexcept = default; /*NOLINT(bugprone-macro-parentheses)*/
