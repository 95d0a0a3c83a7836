// Copyright (c) 2026, seq-guid contributors
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SEQ_GUID_FORK_HANDLER_H_INCLUDED
#define HEADER_SEQ_GUID_FORK_HANDLER_H_INCLUDED

#include <exception>
#include <optional>
#include <type_traits>

#if __has_include(<unistd.h>)
    #include <unistd.h>
    #include <pthread.h>
    #include <signal.h>

    #define SGUID_HANDLE_FORK 1
#else
    #define SGUID_HANDLE_FORK 0
#endif


namespace sguid::impl {

    /**
     * Per-thread instance of T that a forked child never inherits.
     *
     * After fork() the child constructs a fresh T on first access, so a generator
     * seeded from system entropy does not repeat its parent's output.
     */
    template<class T>
    class fork_aware_thread_local {
    public:
        fork_aware_thread_local() = delete;

    #if SGUID_HANDLE_FORK

        static T & instance() {
            [[maybe_unused]] static const bool registered = [] {
                if (pthread_atfork(nullptr, nullptr, on_fork_child) != 0)
                    std::terminate();
                return true;
            }();

            thread_local slot current;
            const auto generation = s_generation;
            if (!current.obj || current.generation != generation) {
                current.obj.emplace();
                current.generation = generation;
            }
            return *current.obj;
        }

    private:
        using counter = std::make_unsigned_t<sig_atomic_t>;

        struct slot {
            std::optional<T> obj;
            counter generation = 0;
        };

        //Runs in the single thread of the child. Async signal safe operations only.
        static void on_fork_child()
            { s_generation = s_generation + 1; }

        static inline volatile counter s_generation = 0;

    #else

        static T & instance() {
            thread_local T obj;
            return obj;
        }

    #endif
    };
}

#endif
