/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/tokens/registry.hpp>
#include <ts/tokens/value.hpp>

namespace tds_stream::tokens {
    void decode_row(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done)
    {
        auto res = std::make_shared<row_token>();
        res->columns.reserve(cols.size());
        p.read_repeat(cols.size(), [&p, &cols, &opts, res](const size_t idx, const stream_reader::action &next) {
            read_value(p, cols[idx], opts, [res, next](column_value v) {
                res->columns.emplace_back(std::move(v));
                next();
            });
        }, [res, done] {
            done(std::move(*res));
        });
    }

    void decode_nbc_row(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done)
    {
        p.read_buffer((cols.size() + 7) / 8, [&p, &cols, &opts, done](const buffer bitmap_b) {
            // the view is released once this callback returns
            auto bitmap = std::make_shared<uint8_vector>(bitmap_b);
            auto res = std::make_shared<nbc_row_token>();
            res->columns.reserve(cols.size());
            p.read_repeat(cols.size(), [&p, &cols, &opts, bitmap, res](const size_t idx, const stream_reader::action &next) {
                if ((*bitmap)[idx / 8] & (1U << (idx % 8))) {
                    res->columns.emplace_back();
                    next();
                    return;
                }
                read_value(p, cols[idx], opts, [res, next](column_value v) {
                    res->columns.emplace_back(std::move(v));
                    next();
                });
            }, [res, done] {
                done(std::move(*res));
            });
        });
    }
}
