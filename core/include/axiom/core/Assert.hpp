/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides AXIOM_ASSERT (debug-only), AXIOM_VERIFY (always evaluated), and
 * AXIOM_UNREACHABLE (marks provably dead code paths). The macros print the
 * failing expression together with the file, line, and function before
 * aborting. AXIOM_ASSERT compiles to nothing unless AXIOM_DEBUG is defined.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AXIOM_CORE_ASSERT_HPP
    #define AXIOM_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace axiom::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[AXIOM ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace axiom::core::detail

    #ifdef AXIOM_DEBUG
        #define AXIOM_ASSERT(cond)                                        \
            do {                                                           \
                if (AXIOM_UNLIKELY(!(cond)))                               \
                    ::axiom::core::detail::assertFail(#cond);              \
            } while (false)
    #else
        #define AXIOM_ASSERT(cond) ((void)0)
    #endif

    #define AXIOM_VERIFY(cond)                                            \
        do {                                                               \
            if (AXIOM_UNLIKELY(!(cond)))                                   \
                ::axiom::core::detail::assertFail(#cond);                  \
        } while (false)

    #define AXIOM_UNREACHABLE()                                           \
        do {                                                               \
            ::axiom::core::detail::assertFail("UNREACHABLE");              \
        } while (false)

#endif // AXIOM_CORE_ASSERT_HPP
