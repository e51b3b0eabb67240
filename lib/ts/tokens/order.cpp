/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    void decode_order(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        p.read_uint16_le([&p, done](const uint16_t length) {
            if (length % 2 != 0) [[unlikely]]
                throw protocol_error(fmt::format("the length of an ORDER token must be even but got {}", length));
            auto res = std::make_shared<order_token>();
            res->columns.reserve(length / 2);
            p.read_repeat(length / 2, [&p, res](size_t, const stream_reader::action &next) {
                p.read_uint16_le([res, next](const uint16_t col) {
                    res->columns.emplace_back(col);
                    next();
                });
            }, [res, done] {
                done(std::move(*res));
            });
        });
    }

    void decode_return_status(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        p.read_int32_le([done](const int32_t value) {
            done(return_status_token { value });
        });
    }

    void decode_sspi(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        p.read_us_var_byte([done](const buffer data) {
            done(sspi_token { uint8_vector { data } });
        });
    }
}
