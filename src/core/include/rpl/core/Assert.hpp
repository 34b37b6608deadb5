/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides RPL_ASSERT (debug-only) and RPL_VERIFY (always evaluated).
 * Both print the failing expression together with the file, line, and
 * function before aborting.  In release builds RPL_ASSERT is a no-op.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RPL_CORE_ASSERT_HPP
    #define RPL_CORE_ASSERT_HPP

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rpl::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[RPL ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rpl::core::detail

    #ifdef RPL_DEBUG
        #define RPL_ASSERT(cond)                                          \
            do {                                                           \
                if (!(cond)) [[unlikely]]                                  \
                    ::rpl::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define RPL_ASSERT(cond) ((void)0)
    #endif

    #define RPL_VERIFY(cond)                                              \
        do {                                                               \
            if (!(cond)) [[unlikely]]                                      \
                ::rpl::core::detail::assertFail(#cond);                    \
        } while (false)

#endif // RPL_CORE_ASSERT_HPP
