// Copyright (c) 2026, seq-guid contributors
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SEQ_GUID_RANDOM_GENERATOR_H_INCLUDED
#define HEADER_SEQ_GUID_RANDOM_GENERATOR_H_INCLUDED

#include <cstdint>
#include <random>

#include <chacha20.hpp>


namespace sguid::impl {

    using prng = chacha20_12;

    //Per-thread generator seeded from system entropy. Reseeded in a forked child.
    prng & get_random_generator();

    //Fresh generator whose output depends only on the seed
    prng make_seeded_generator(uint32_t seed);
}

#endif
