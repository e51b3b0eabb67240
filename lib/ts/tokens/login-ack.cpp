/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/logger.hpp>
#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    static std::string interface_name(const uint8_t id)
    {
        switch (id) {
            case 0: return "SQL_DFLT";
            case 1: return "SQL_TSQL";
            default:
                logger::debug("LOGINACK with an unknown interface type: {}", id);
                return fmt::format("{}", id);
        }
    }

    void decode_login_ack(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        auto res = std::make_shared<login_ack_token>();
        p.read_uint16_le([&p, done, res](const uint16_t) {
            p.read_uint8([&p, done, res](const uint8_t iface) {
                res->interface_name = interface_name(iface);
                p.read_uint32_be([&p, done, res](const uint32_t ver) {
                    res->protocol_version = tds_version_name(ver);
                    p.read_b_var_char([&p, done, res](std::string prog_name) {
                        res->prog_name = std::move(prog_name);
                        p.read_buffer(4, [done, res](const buffer ver_b) {
                            res->version = prog_version { ver_b[0], ver_b[1], ver_b[2], ver_b[3] };
                            done(std::move(*res));
                        });
                    });
                });
            });
        });
    }
}
