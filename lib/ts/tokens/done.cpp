/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    template<typename T>
    static void decode_done_like(parser &p, const parser_options &opts, const token_callback &done)
    {
        p.read_uint16_le([&p, &opts, done](const uint16_t status) {
            p.read_uint16_le([&p, &opts, done, status](const uint16_t cur_cmd) {
                const auto finish = [done, status, cur_cmd](const double row_count) {
                    T res {};
                    res.status = status;
                    res.cur_cmd = cur_cmd;
                    res.row_count = row_count;
                    done(std::move(res));
                };
                if (opts.at_least(tds_version::v7_2))
                    p.read_uint64_le(finish);
                else
                    p.read_uint32_le([finish](const uint32_t row_count) { finish(row_count); });
            });
        });
    }

    void decode_done(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        decode_done_like<done_token>(p, opts, done);
    }

    void decode_done_proc(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        decode_done_like<done_proc_token>(p, opts, done);
    }

    void decode_done_in_proc(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        decode_done_like<done_in_proc_token>(p, opts, done);
    }
}
