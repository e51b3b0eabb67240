/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    using env_callback = std::function<void(env_value, env_value)>;

    static void read_char_pair(parser &p, env_callback cb)
    {
        p.read_b_var_char([&p, cb=std::move(cb)](std::string new_val) {
            p.read_b_var_char([cb, new_val=std::move(new_val)](std::string old_val) {
                cb(std::move(new_val), std::move(old_val));
            });
        });
    }

    static void read_byte_pair(parser &p, env_callback cb)
    {
        p.read_b_var_byte([&p, cb=std::move(cb)](const buffer new_b) {
            p.read_b_var_byte([cb, new_val=uint8_vector { new_b }](const buffer old_b) {
                cb(new_val, uint8_vector { old_b });
            });
        });
    }

    static env_value packet_size(const std::string &s)
    {
        if (s.empty())
            return {};
        uint32_t val = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
        if (ec != std::errc {} || ptr != s.data() + s.size()) [[unlikely]]
            throw protocol_error(fmt::format("invalid packet size in an ENVCHANGE token: '{}'", s));
        return val;
    }

    static void read_routing(parser &p, env_callback cb)
    {
        p.read_uint16_le([&p, cb=std::move(cb)](const uint16_t) {
            p.read_uint8([&p, cb](const uint8_t protocol) {
                p.read_uint16_le([&p, cb, protocol](const uint16_t port) {
                    p.read_us_var_char([&p, cb, protocol, port](std::string server) {
                        // the old value is always empty
                        p.read_us_var_byte([cb, val=routing_info { protocol, port, std::move(server) }](const buffer) {
                            cb(val, env_value {});
                        });
                    });
                });
            });
        });
    }

    void decode_env_change(parser &p, const column_list &, const parser_options &, const token_callback &done)
    {
        p.read_uint16_le([&p, done](const uint16_t length) {
            if (length == 0) [[unlikely]]
                throw protocol_error("an ENVCHANGE token must contain at least the change type");
            p.read_uint8([&p, done, length](const uint8_t type_id) {
                const auto type = static_cast<env_change_type>(type_id);
                const env_callback finish = [done, type](env_value new_val, env_value old_val) {
                    done(env_change_token { type, std::move(new_val), std::move(old_val) });
                };
                switch (type) {
                    case env_change_type::database:
                    case env_change_type::language:
                    case env_change_type::charset:
                    case env_change_type::database_mirroring_partner:
                        read_char_pair(p, finish);
                        break;
                    case env_change_type::packet_size:
                        read_char_pair(p, [finish](env_value new_val, env_value old_val) {
                            finish(packet_size(std::get<std::string>(new_val)), packet_size(std::get<std::string>(old_val)));
                        });
                        break;
                    case env_change_type::sql_collation:
                    case env_change_type::begin_txn:
                    case env_change_type::commit_txn:
                    case env_change_type::rollback_txn:
                    case env_change_type::reset_connection:
                        read_byte_pair(p, finish);
                        break;
                    case env_change_type::routing_change:
                        read_routing(p, finish);
                        break;
                    default:
                        p.read_buffer(length - 1U, [finish](const buffer b) {
                            finish(uint8_vector { b }, env_value {});
                        });
                        break;
                }
            });
        });
    }
}
