/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_TEXT_HPP
#define TDS_STREAM_TEXT_HPP

#include <string>
#include <ts/common/bytes.hpp>

namespace tds_stream::text {
    // Two bytes per character, little-endian. Unpaired surrogates become U+FFFD.
    extern std::string from_ucs2(buffer bytes);
    // One byte per character, each byte is the code point.
    extern std::string from_latin1(buffer bytes);
}

#endif // !TDS_STREAM_TEXT_HPP
