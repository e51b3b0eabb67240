/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_TOKENS_TEST_HPP
#define TDS_STREAM_TOKENS_TEST_HPP

#include <ts/common/test.hpp>
#include <ts/token-parser.hpp>

namespace tds_stream::tokens {
    inline std::vector<token> test_decode(const buffer bytes, const size_t chunk_size, const parser_options &opts={}, const column_list &cols={})
    {
        std::vector<token> tokens {};
        parser p { [&](token &&t) { tokens.emplace_back(std::move(t)); }, opts, cols };
        for (size_t off = 0; off < bytes.size(); off += chunk_size)
            p.write(bytes.subbuf(off, std::min(chunk_size, bytes.size() - off)));
        expect(!p.suspended()) << "chunk size" << chunk_size;
        expect(!p.failed());
        test_same(0, p.buffered());
        return tokens;
    }

    // decodes the stream as a single chunk and checks that every chunk size yields the same tokens
    inline std::vector<token> test_decode_any_chunking(const std::string_view hex, const parser_options &opts={}, const column_list &cols={})
    {
        const auto bytes = uint8_vector::from_hex(hex);
        auto exp = test_decode(bytes, bytes.size(), opts, cols);
        for (size_t chunk_size = 1; chunk_size < bytes.size(); ++chunk_size) {
            if (!test_same(exp, test_decode(bytes, chunk_size, opts, cols)))
                break;
        }
        return exp;
    }

    template<typename T>
    T test_decode_single(const std::string_view hex, const parser_options &opts={}, const column_list &cols={})
    {
        const auto tokens = test_decode_any_chunking(hex, opts, cols);
        if (tokens.size() != 1 || !std::holds_alternative<T>(tokens.front())) [[unlikely]]
            throw error(fmt::format("expected a single token but got: {}", tokens));
        return std::get<T>(tokens.front());
    }
}

#endif // !TDS_STREAM_TOKENS_TEST_HPP
