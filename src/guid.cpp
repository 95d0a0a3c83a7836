// Copyright (c) 2026, seq-guid contributors
// SPDX-License-Identifier: BSD-3-Clause

#include <seq-guid/guid.h>

#include "random_generator.h"

using namespace sguid;

template<class Gen>
static auto random_bytes(Gen & gen) -> guid {
    std::uniform_int_distribution<uint32_t> distrib;

    guid ret;
    auto data = ret.bytes.data();
    for (int i = 0; i < 4; ++i)
        data = impl::store<std::endian::big>(distrib(gen), data);
    return ret;
}

static auto now() -> guid::time_point {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
}

auto guid::generate_random() noexcept -> guid {
    auto ret = random_bytes(impl::get_random_generator());

    //Microsoft byte order: data3 is little endian so the version nibble is in byte 7
    ret.bytes[8] = uint8_t((ret.bytes[8] & 0x3F) | 0x80);
    ret.bytes[7] = uint8_t((ret.bytes[7] & 0x0F) | 0x40);

    return ret;
}

auto guid::generate_sequential(layout lo) -> guid {
    return guid::generate_random().with_created_at(now(), lo);
}

auto guid::generate_sequential(time_point created_at, layout lo) -> guid {
    return guid::generate_random().with_created_at(created_at, lo);
}

auto guid::generate_sequential(const guid & base, layout lo) -> guid {
    return guid::generate_sequential(base, now(), lo);
}

auto guid::generate_sequential(const guid & base, time_point created_at, layout lo) -> guid {
    auto ret = base.with_created_at(created_at, lo);
    //Only possible for a Nil base and the very first tick after the epoch
    if (ret == guid())
        SGUID_THROW(std::invalid_argument("sequential guid would be Nil"));
    return ret;
}

auto guid::generate_sequential_seeded(uint32_t seed, layout lo) -> guid {
    return guid::generate_sequential_seeded(seed, now(), lo);
}

auto guid::generate_sequential_seeded(uint32_t seed, time_point created_at, layout lo) -> guid {
    auto gen = impl::make_seeded_generator(seed);
    return random_bytes(gen).with_created_at(created_at, lo);
}
