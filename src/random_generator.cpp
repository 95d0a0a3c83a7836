// Copyright (c) 2026, seq-guid contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "random_generator.h"
#include "fork_handler.h"

#include <randutils.hpp>

namespace sguid::impl {

    prng & get_random_generator() {

        struct generator : prng {
            generator():
                prng(randutils::auto_seed_128{}.base())
            {}
        };

        return fork_aware_thread_local<generator>::instance();
    }

    prng make_seeded_generator(uint32_t seed) {
        randutils::seed_seq_fe128 seq{seed};
        return prng(seq);
    }

}
