/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iterator>
#include <utfcpp/utf8.h>
#include <ts/text.hpp>

namespace tds_stream::text {
    static constexpr uint32_t replacement_char = 0xFFFD;

    static bool is_high_surrogate(const uint32_t k)
    {
        return k >= 0xD800 && k <= 0xDBFF;
    }

    static bool is_low_surrogate(const uint32_t k)
    {
        return k >= 0xDC00 && k <= 0xDFFF;
    }

    std::string from_ucs2(const buffer bytes)
    {
        if (bytes.size() % 2 != 0) [[unlikely]]
            throw error(fmt::format("UCS-2 text must have an even number of bytes but got {}", bytes.size()));
        std::string res {};
        res.reserve(bytes.size());
        auto out_it = std::back_inserter(res);
        const size_t num_units = bytes.size() / 2;
        for (size_t i = 0; i < num_units; ++i) {
            const uint32_t k = bytes.subbuf(i * 2, 2).to<uint16_t>();
            if (is_high_surrogate(k) && i + 1 < num_units) {
                if (const uint32_t lo = bytes.subbuf((i + 1) * 2, 2).to<uint16_t>(); is_low_surrogate(lo)) {
                    out_it = utf8::append(0x10000 + ((k - 0xD800) << 10) + (lo - 0xDC00), out_it);
                    ++i;
                    continue;
                }
            }
            if (is_high_surrogate(k) || is_low_surrogate(k))
                out_it = utf8::append(replacement_char, out_it);
            else
                out_it = utf8::append(k, out_it);
        }
        return res;
    }

    std::string from_latin1(const buffer bytes)
    {
        std::string res {};
        res.reserve(bytes.size());
        auto out_it = std::back_inserter(res);
        for (const uint8_t b: bytes)
            out_it = utf8::append(static_cast<uint32_t>(b), out_it);
        return res;
    }
}
