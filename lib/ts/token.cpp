/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/token.hpp>

namespace fmt {
    template<>
    struct formatter<tds_stream::env_value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return std::visit([&](const auto &vv) {
                using T = std::decay_t<decltype(vv)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return fmt::format_to(ctx.out(), "none");
                } else if constexpr (std::is_same_v<T, tds_stream::routing_info>) {
                    return fmt::format_to(ctx.out(), "{}:{} protocol: {}", vv.server, vv.port, vv.protocol);
                } else {
                    return fmt::format_to(ctx.out(), "{}", vv);
                }
            }, v);
        }
    };
}

namespace tds_stream {
    const char *token_name(const token &t)
    {
        return std::visit([](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, colmetadata_token>) {
                return "COLMETADATA";
            } else if constexpr (std::is_same_v<T, done_token>) {
                return "DONE";
            } else if constexpr (std::is_same_v<T, done_in_proc_token>) {
                return "DONEINPROC";
            } else if constexpr (std::is_same_v<T, done_proc_token>) {
                return "DONEPROC";
            } else if constexpr (std::is_same_v<T, env_change_token>) {
                return "ENVCHANGE";
            } else if constexpr (std::is_same_v<T, error_token>) {
                return "ERROR";
            } else if constexpr (std::is_same_v<T, info_token>) {
                return "INFO";
            } else if constexpr (std::is_same_v<T, feature_ext_ack_token>) {
                return "FEATUREEXTACK";
            } else if constexpr (std::is_same_v<T, fedauth_info_token>) {
                return "FEDAUTHINFO";
            } else if constexpr (std::is_same_v<T, login_ack_token>) {
                return "LOGINACK";
            } else if constexpr (std::is_same_v<T, order_token>) {
                return "ORDER";
            } else if constexpr (std::is_same_v<T, return_status_token>) {
                return "RETURNSTATUS";
            } else if constexpr (std::is_same_v<T, return_value_token>) {
                return "RETURNVALUE";
            } else if constexpr (std::is_same_v<T, row_token>) {
                return "ROW";
            } else if constexpr (std::is_same_v<T, nbc_row_token>) {
                return "NBCROW";
            } else if constexpr (std::is_same_v<T, sspi_token>) {
                return "SSPI";
            } else if constexpr (std::is_same_v<T, end_of_message_token>) {
                return "END_OF_MESSAGE";
            } else {
                static_assert(sizeof(T) == 0, "unsupported token type");
            }
        }, t);
    }

    static std::string describe_done(const done_info &d)
    {
        std::string res = fmt::format("status: 0x{:04X} cur_cmd: {}", d.status, d.cur_cmd);
        if (d.row_count_valid())
            res += fmt::format(" rows: {}", d.row_count);
        if (d.more())
            res += " more";
        if (d.sql_error())
            res += " error";
        if (d.attention())
            res += " attention";
        if (d.server_error())
            res += " server-error";
        return res;
    }

    static std::string describe_message(const message_info &m)
    {
        return fmt::format("#{} state: {} class: {} line: {} server: '{}' proc: '{}' message: '{}'",
            m.number, m.state, m.clazz, m.line_number, m.server_name, m.proc_name, m.message);
    }

    std::string describe(const token &t)
    {
        const auto details = std::visit([](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, colmetadata_token>) {
                return fmt::format("{}", v.columns);
            } else if constexpr (std::is_base_of_v<done_info, T>) {
                return describe_done(v);
            } else if constexpr (std::is_same_v<T, env_change_token>) {
                return fmt::format("type: {} new: {} old: {}", static_cast<int>(v.type), v.new_value, v.old_value);
            } else if constexpr (std::is_base_of_v<message_info, T>) {
                return describe_message(v);
            } else if constexpr (std::is_same_v<T, feature_ext_ack_token>) {
                std::string res = fmt::format("features: {}", v.features.size());
                for (const auto &[id, data]: v.features)
                    res += fmt::format(" 0x{:02X}: {}", id, data);
                return res;
            } else if constexpr (std::is_same_v<T, fedauth_info_token>) {
                return fmt::format("sts_url: {} spn: {}", v.sts_url, v.spn);
            } else if constexpr (std::is_same_v<T, login_ack_token>) {
                return fmt::format("interface: {} tds: {} program: '{}' version: {}.{}.{}.{}", v.interface_name, v.protocol_version,
                    v.prog_name, v.version.major, v.version.minor, v.version.build_num_hi, v.version.build_num_low);
            } else if constexpr (std::is_same_v<T, order_token>) {
                return fmt::format("columns: {}", v.columns);
            } else if constexpr (std::is_same_v<T, return_status_token>) {
                return fmt::format("value: {}", v.value);
            } else if constexpr (std::is_same_v<T, return_value_token>) {
                return fmt::format("#{} {} status: {} value: {}", v.param_ordinal, v.metadata, v.status, v.value);
            } else if constexpr (std::is_same_v<T, row_token> || std::is_same_v<T, nbc_row_token>) {
                return fmt::format("{}", v.columns);
            } else if constexpr (std::is_same_v<T, sspi_token>) {
                return fmt::format("{} bytes: {}", v.data.size(), v.data);
            } else {
                return {};
            }
        }, t);
        if (details.empty())
            return token_name(t);
        return fmt::format("{} {}", token_name(t), details);
    }
}
