/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/text.hpp>
#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    void decode_feature_ext_ack(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        auto res = std::make_shared<feature_ext_ack_token>();
        p.read_loop([&p, res](const stream_reader::loop_control &next) {
            p.read_uint8([&p, res, next](const uint8_t id) {
                if (id == feature_ext_ack_token::feature_terminator) {
                    next(false);
                    return;
                }
                p.read_uint32_le([&p, res, next, id](const uint32_t len) {
                    p.read_buffer(len, [res, next, id](const buffer data) {
                        if (id == feature_ext_ack_token::feature_fedauth)
                            res->fed_auth.emplace(data);
                        res->features.insert_or_assign(id, uint8_vector { data });
                        next(true);
                    });
                });
            });
        }, [res, done] {
            done(std::move(*res));
        });
    }

    void decode_fedauth_info(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        p.read_uint32_le([&p, done](const uint32_t length) {
            p.read_buffer(length, [done](const buffer data) {
                if (data.size() < 4) [[unlikely]]
                    throw protocol_error(fmt::format("a FEDAUTHINFO token of {} bytes is too short", data.size()));
                const auto count = data.subbuf(0, 4).to<uint32_t>();
                if (data.size() < 4 + size_t { count } * 9) [[unlikely]]
                    throw protocol_error(fmt::format("a FEDAUTHINFO token of {} bytes cannot hold {} options", data.size(), count));
                fedauth_info_token res {};
                for (size_t i = 0; i < count; ++i) {
                    const auto opt = data.subbuf(4 + i * 9, 9);
                    const auto id = opt[0];
                    const auto len = opt.subbuf(1, 4).to<uint32_t>();
                    // offsets are relative to the start of the option count
                    const auto off = opt.subbuf(5, 4).to<uint32_t>();
                    if (size_t { off } + len > data.size()) [[unlikely]]
                        throw protocol_error(fmt::format("a FEDAUTHINFO option at offset {} of {} bytes ends after the token", off, len));
                    const auto val = text::from_ucs2(data.subbuf(off, len));
                    switch (id) {
                        case fedauth_info_token::info_stsurl: res.sts_url.emplace(val); break;
                        case fedauth_info_token::info_spn: res.spn.emplace(val); break;
                        default: break;
                    }
                }
                done(std::move(res));
            });
        });
    }
}
