/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    template<typename T>
    static void decode_message(parser &p, const parser_options &opts, const token_callback &done)
    {
        auto res = std::make_shared<T>();
        // the token length is implied by its fields
        p.read_uint16_le([&p, &opts, done, res](const uint16_t) {
            p.read_buffer(6, [&p, &opts, done, res](const buffer hdr) {
                res->number = hdr.subbuf(0, 4).to<uint32_t>();
                res->state = hdr[4];
                res->clazz = hdr[5];
                p.read_us_var_char([&p, &opts, done, res](std::string msg) {
                    res->message = std::move(msg);
                    p.read_b_var_char([&p, &opts, done, res](std::string server) {
                        res->server_name = std::move(server);
                        p.read_b_var_char([&p, &opts, done, res](std::string proc) {
                            res->proc_name = std::move(proc);
                            const auto finish = [done, res](const uint32_t line) {
                                res->line_number = line;
                                done(std::move(*res));
                            };
                            if (opts.at_least(tds_version::v7_2))
                                p.read_uint32_le(finish);
                            else
                                p.read_uint16_le(finish);
                        });
                    });
                });
            });
        });
    }

    void decode_error(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        decode_message<error_token>(p, opts, done);
    }

    void decode_info(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        decode_message<info_token>(p, opts, done);
    }
}
