// Copyright (c) 2026, seq-guid contributors
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SEQ_GUID_GUID_H_INCLUDED
#define HEADER_SEQ_GUID_GUID_H_INCLUDED

#include <seq-guid/common.h>

#if defined(_WIN32)
    #include <guiddef.h>
#endif

namespace sguid {

    namespace impl {
        //Storage index of the byte shown at each position of the text form.
        //Data1, Data2 and Data3 are stored little endian but printed as numbers.
        inline constexpr uint8_t text_order[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};

        //Text byte positions followed by a dash: 8-4-4-4-12
        constexpr bool dash_after(size_t pos) noexcept
            { return pos == 3 || pos == 5 || pos == 7 || pos == 9; }

        template<char_like C>
        constexpr int hex_value(C c) noexcept {
            if (c >= C('0') && c <= C('9'))
                return int(c - C('0'));
            if (c >= C('a') && c <= C('f'))
                return int(c - C('a')) + 10;
            if (c >= C('A') && c <= C('F'))
                return int(c - C('A')) + 10;
            return -1;
        }

        template<char_like C>
        constexpr C hex_digit(unsigned nibble, bool upper) noexcept
            { return C((upper ? "0123456789ABCDEF" : "0123456789abcdef")[nibble]); }
    }

    /**
     * GUID fields as Windows, .NET and SQL Server see them.
     *
     * The first three fields are serialized little endian.
     */
    struct ms_guid_parts {
        uint32_t    data1;
        uint16_t    data2;
        uint16_t    data3;
        uint8_t     data4[8];
    };


    /**
     * A 16 byte GUID in Microsoft serialized byte order
     *
     * `bytes` hold exactly what .NET `Guid.ToByteArray()` returns and SQL Server stores.
     * The text form is the usual Microsoft one, so Data1, Data2 and Data3 appear
     * byte-swapped relative to `bytes`.
     */
    class guid {
    public:
        /**
         * Placement of the embedded creation time.
         *
         * Must be the same for generation and extraction.
         */
        enum class layout : uint8_t {
            /// Big endian time in the last 6 bytes. Sorts well in SQL Server which compares them first
            reversed,
            /// Little endian time in the first 6 bytes
            forward
        };

        enum format {
            lowercase,
            uppercase
        };

        /// Timestamps are always UTC
        using time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

        /// Resolution of the embedded time of day
        using ticks = std::chrono::duration<int64_t, std::ratio<1, 300>>;

        static constexpr ticks ticks_per_day = std::chrono::days{1};

        /// Day offsets are counted from this date
        static constexpr std::chrono::sys_days sequential_epoch{std::chrono::year{2000}/std::chrono::January/1};

        /// Latest day that can be embedded
        static constexpr std::chrono::sys_days sequential_last_day =
            sequential_epoch + std::chrono::days{std::numeric_limits<uint16_t>::max()};

        /// Length of the text form
        static constexpr size_t char_length = 36;

        std::array<uint8_t, 16> bytes{};

    private:
        template<impl::char_like C>
        static constexpr auto parse(const C * text) noexcept -> std::optional<guid> {
            guid ret;
            for (size_t pos = 0; pos != ret.bytes.size(); ++pos) {
                const int high = impl::hex_value(text[0]);
                const int low = impl::hex_value(text[1]);
                if (high < 0 || low < 0)
                    return std::nullopt;
                ret.bytes[impl::text_order[pos]] = uint8_t((high << 4) | low);
                text += 2;
                if (impl::dash_after(pos) && *text++ != C('-'))
                    return std::nullopt;
            }
            return ret;
        }

        template<impl::char_like C>
        static constexpr auto parse(std::basic_string_view<C> text) noexcept -> std::optional<guid> {
            if (text.size() != guid::char_length)
                return std::nullopt;
            return guid::parse(text.data());
        }

    public:
        ///Constructs a Nil guid
        constexpr guid() noexcept = default;

        ///Constructs guid from its text form at compile time
        template<impl::char_like C>
        consteval guid(const C (&text)[guid::char_length + 1]) {
            auto parsed = guid::parse(text);
            if (!parsed || text[guid::char_length] != C(0))
                impl::invalid_constexpr_call("malformed guid literal");
            this->bytes = parsed->bytes;
        }

        /// Constructs guid from serialized bytes
        template<impl::byte_like Byte>
        constexpr guid(std::span<Byte, 16> src) noexcept {
            for (size_t i = 0; i != src.size(); ++i)
                this->bytes[i] = uint8_t(src[i]);
        }

        template<impl::byte_like Byte>
        constexpr guid(const std::array<Byte, 16> & src) noexcept:
            guid(std::span<const Byte, 16>(src))
        {}

        constexpr guid(const ms_guid_parts & parts) noexcept {
            auto dest = this->bytes.data();
            dest = impl::store<std::endian::little>(parts.data1, dest);
            dest = impl::store<std::endian::little>(parts.data2, dest);
            dest = impl::store<std::endian::little>(parts.data3, dest);
            std::copy(std::begin(parts.data4), std::end(parts.data4), dest);
        }

    #ifdef _WIN32
        constexpr guid(const GUID & val) noexcept:
            guid(ms_guid_parts{val.Data1, val.Data2, val.Data3,
                               {val.Data4[0], val.Data4[1], val.Data4[2], val.Data4[3],
                                val.Data4[4], val.Data4[5], val.Data4[6], val.Data4[7]}})
        {}
    #endif

        /**
         * Generates a random guid
         *
         * The result is a version 4 GUID as Windows generates it: the version is the
         * high nibble of Data3.
         */
        SGUID_EXPORTED static auto generate_random() noexcept -> guid;

        /**
         * Generates a sequential guid with random base and current time
         *
         * @throws std::out_of_range if the current date is not within
         * [sequential_epoch, sequential_last_day]
         */
        SGUID_EXPORTED static auto generate_sequential(layout lo = layout::reversed) -> guid;

        /**
         * Generates a sequential guid with random base and the given creation time
         *
         * @throws std::out_of_range if created_at is not within
         * [sequential_epoch, sequential_last_day]
         */
        SGUID_EXPORTED static auto generate_sequential(time_point created_at, layout lo = layout::reversed) -> guid;

        /**
         * Generates a sequential guid from the given base and current time
         *
         * All bytes other than the embedded time are copied from the base.
         *
         * @throws std::out_of_range if the current date is not within
         * [sequential_epoch, sequential_last_day]
         * @throws std::invalid_argument if the result would be a Nil guid
         */
        SGUID_EXPORTED static auto generate_sequential(const guid & base, layout lo = layout::reversed) -> guid;

        /**
         * Generates a sequential guid from the given base and creation time
         *
         * @throws std::out_of_range if created_at is not within
         * [sequential_epoch, sequential_last_day]
         * @throws std::invalid_argument if the result would be a Nil guid
         */
        SGUID_EXPORTED static auto generate_sequential(const guid & base, time_point created_at, layout lo = layout::reversed) -> guid;

        /**
         * Generates a sequential guid whose random part comes from a deterministic generator
         *
         * The same seed and the same creation time (to tick precision) always produce the
         * same guid. This is meant for reproducible tests. Do not use it to produce real
         * identifiers.
         */
        SGUID_EXPORTED static auto generate_sequential_seeded(uint32_t seed, layout lo = layout::reversed) -> guid;

        /// Same as above with an explicit creation time
        SGUID_EXPORTED static auto generate_sequential_seeded(uint32_t seed, time_point created_at, layout lo = layout::reversed) -> guid;

        /**
         * Returns a copy of this guid with creation time embedded
         *
         * Only the 6 bytes designated by the layout are changed. Time of day is
         * truncated to whole ticks.
         *
         * @throws std::out_of_range if created_at is not within
         * [sequential_epoch, sequential_last_day]
         */
        constexpr auto with_created_at(time_point created_at, layout lo = layout::reversed) const -> guid {
            using namespace std::chrono;

            const sys_days day = floor<days>(created_at);
            if (day < guid::sequential_epoch || day > guid::sequential_last_day)
                SGUID_THROW(std::out_of_range("creation time cannot be represented in a sequential guid"));

            const auto day_offset = uint16_t((day - guid::sequential_epoch).count());
            const auto time_of_day = uint32_t(floor<ticks>(created_at - day).count());

            guid ret = *this;
            auto data = ret.bytes.data();
            if (lo == layout::reversed) {
                data = impl::store<std::endian::big>(time_of_day, data + 10);
                impl::store<std::endian::big>(day_offset, data);
            } else {
                data = impl::store<std::endian::little>(day_offset, data);
                impl::store<std::endian::little>(time_of_day, data);
            }
            return ret;
        }

        static constexpr guid max() noexcept {
            guid ret;
            ret.bytes.fill(0xFF);
            return ret;
        }

        constexpr friend auto operator==(const guid & lhs, const guid & rhs) noexcept -> bool = default;
        /// Compares serialized bytes, not the text form
        constexpr friend auto operator<=>(const guid & lhs, const guid & rhs) noexcept -> std::strong_ordering = default;

        constexpr auto to_ms_parts() const noexcept -> ms_guid_parts {
            ms_guid_parts ret;
            auto src = this->bytes.data();
            src = impl::load<std::endian::little>(src, ret.data1);
            src = impl::load<std::endian::little>(src, ret.data2);
            src = impl::load<std::endian::little>(src, ret.data3);
            std::copy(src, src + 8, ret.data4);
            return ret;
        }

    #ifdef _WIN32
        constexpr auto to_GUID() const noexcept -> GUID {
            const auto parts = this->to_ms_parts();
            GUID ret{parts.data1, parts.data2, parts.data3, {}};
            std::copy(std::begin(parts.data4), std::end(parts.data4), ret.Data4);
            return ret;
        }
    #endif

        /// Parses the 36 character text form. Returns nothing if the text is malformed
        static constexpr auto from_chars(std::string_view text) noexcept -> std::optional<guid>
            { return guid::parse(text); }
        static constexpr auto from_chars(std::wstring_view text) noexcept -> std::optional<guid>
            { return guid::parse(text); }

        /// Returns the text form
        template<impl::char_like C = char>
        constexpr auto to_chars(format fmt = lowercase) const noexcept -> std::array<C, guid::char_length> {
            std::array<C, guid::char_length> ret{};
            auto out = ret.begin();
            for (size_t pos = 0; pos != this->bytes.size(); ++pos) {
                const uint8_t val = this->bytes[impl::text_order[pos]];
                *out++ = impl::hex_digit<C>(val >> 4, fmt == uppercase);
                *out++ = impl::hex_digit<C>(val & 0x0F, fmt == uppercase);
                if (impl::dash_after(pos))
                    *out++ = C('-');
            }
            return ret;
        }

        template<impl::char_like C = char>
        auto to_string(format fmt = lowercase) const -> std::basic_string<C> {
            const auto chars = this->to_chars<C>(fmt);
            return std::basic_string<C>(chars.begin(), chars.end());
        }

        /// Honors std::uppercase
        template<impl::char_like C>
        friend auto operator<<(std::basic_ostream<C> & str, const guid & val) -> std::basic_ostream<C> & {
            const auto chars = val.to_chars<C>(str.flags() & std::ios_base::uppercase ? guid::uppercase : guid::lowercase);
            return str.write(chars.data(), std::streamsize(chars.size()));
        }

        //FNV-1a over the bytes
        friend constexpr size_t hash_value(const guid & val) noexcept {
            constexpr bool wide = std::numeric_limits<size_t>::digits >= 64;
            constexpr size_t prime = wide ? size_t(1099511628211ull) : size_t(16777619u);
            size_t ret = wide ? size_t(14695981039346656037ull) : size_t(2166136261u);
            for (uint8_t b: val.bytes) {
                ret ^= b;
                ret *= prime;
            }
            return ret;
        }
    };

    static_assert(sizeof(guid) == 16);

    static_assert(guid::time_point::max() - guid::time_point(guid::sequential_last_day) > guid::ticks_per_day,
                  "every embeddable time must be representable by guid::time_point");

    /**
     * Extracts the creation time embedded by guid::generate_sequential()
     *
     * The layout must be the one used to generate the guid. The result is rounded up
     * to whole nanoseconds so it is never more than one tick earlier than the original
     * time and re-embedding it reproduces the same guid.
     *
     * Writers that approximate a tick as 3.33333 ms store up to ~26 ticks past the end
     * of the day. Such times of day are clamped to the last tick of the day.
     *
     * @returns creation time or std::nullopt for a Nil guid
     */
    constexpr auto get_created_at(const guid & val, guid::layout lo = guid::layout::reversed) noexcept -> std::optional<guid::time_point> {
        using namespace std::chrono;

        if (val == guid())
            return std::nullopt;

        uint16_t day_offset;
        uint32_t time_of_day;
        auto data = val.bytes.data();
        if (lo == guid::layout::reversed) {
            data = impl::load<std::endian::big>(data + 10, time_of_day);
            impl::load<std::endian::big>(data, day_offset);
        } else {
            data = impl::load<std::endian::little>(data, day_offset);
            impl::load<std::endian::little>(data, time_of_day);
        }

        const auto tod = std::min(guid::ticks{time_of_day}, guid::ticks_per_day - guid::ticks{1});
        return guid::time_point(guid::sequential_epoch) + days{day_offset} + ceil<nanoseconds>(tod);
    }

    namespace impl {
        //Accepts an empty spec, "l" (lowercase) or "u" (uppercase)
        template<class It>
        constexpr bool parse_format_spec(It & it, It end, guid::format & fmt) {
            if (it != end && *it != '}') {
                if (*it == 'u')
                    fmt = guid::uppercase;
                else if (*it == 'l')
                    fmt = guid::lowercase;
                else
                    return false;
                ++it;
            }
            return it == end || *it == '}';
        }
    }
}

template<>
struct std::hash<sguid::guid> {
    constexpr size_t operator()(const sguid::guid & val) const noexcept
        { return hash_value(val); }
};


#if SGUID_SUPPORTS_STD_FORMAT

template<class CharT>
struct std::formatter<::sguid::guid, CharT> {
    ::sguid::guid::format fmt = ::sguid::guid::lowercase;

    template<class ParseContext>
    constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
        auto it = ctx.begin();
        if (!::sguid::impl::parse_format_spec(it, ctx.end(), this->fmt))
            SGUID_THROW(std::format_error("invalid format spec for guid"));
        return it;
    }

    template<class FormatContext>
    auto format(const ::sguid::guid & val, FormatContext & ctx) const -> decltype(ctx.out()) {
        const auto chars = val.to_chars<CharT>(this->fmt);
        return std::copy(chars.begin(), chars.end(), ctx.out());
    }
};

#endif

#if SGUID_SUPPORTS_FMT_FORMAT

template<class CharT>
struct fmt::formatter<::sguid::guid, CharT> {
    ::sguid::guid::format fmt = ::sguid::guid::lowercase;

    template<class ParseContext>
    constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
        auto it = ctx.begin();
        if (!::sguid::impl::parse_format_spec(it, ctx.end(), this->fmt))
            FMT_THROW(fmt::format_error("invalid format spec for guid"));
        return it;
    }

    template<class FormatContext>
    auto format(const ::sguid::guid & val, FormatContext & ctx) const -> decltype(ctx.out()) {
        const auto chars = val.to_chars<CharT>(this->fmt);
        return std::copy(chars.begin(), chars.end(), ctx.out());
    }
};

#endif

#endif
