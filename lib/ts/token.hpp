/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_TOKEN_HPP
#define TDS_STREAM_TOKEN_HPP

#include <map>
#include <ts/metadata.hpp>

namespace tds_stream {
    enum class token_type: uint8_t {
        returnstatus = 0x79,
        colmetadata = 0x81,
        order = 0xA9,
        error = 0xAA,
        info = 0xAB,
        returnvalue = 0xAC,
        loginack = 0xAD,
        featureextack = 0xAE,
        row = 0xD1,
        nbcrow = 0xD2,
        envchange = 0xE3,
        sspi = 0xED,
        fedauthinfo = 0xEE,
        done = 0xFD,
        doneproc = 0xFE,
        doneinproc = 0xFF
    };

    struct colmetadata_token {
        column_list columns {};

        bool operator==(const colmetadata_token &) const =default;
    };

    struct done_info {
        static constexpr uint16_t status_more = 0x0001;
        static constexpr uint16_t status_error = 0x0002;
        static constexpr uint16_t status_in_xact = 0x0004;
        static constexpr uint16_t status_count = 0x0010;
        static constexpr uint16_t status_attn = 0x0020;
        static constexpr uint16_t status_srverror = 0x0100;

        uint16_t status = 0;
        uint16_t cur_cmd = 0;
        // 64-bit on TDS 7.2 and later, see stream_reader for the precision of wide integers
        double row_count = 0;

        bool more() const noexcept { return status & status_more; }
        bool sql_error() const noexcept { return status & status_error; }
        bool row_count_valid() const noexcept { return status & status_count; }
        bool attention() const noexcept { return status & status_attn; }
        bool server_error() const noexcept { return status & status_srverror; }

        bool operator==(const done_info &) const =default;
    };

    struct done_token: done_info {
        bool operator==(const done_token &) const =default;
    };

    struct done_in_proc_token: done_info {
        bool operator==(const done_in_proc_token &) const =default;
    };

    struct done_proc_token: done_info {
        bool operator==(const done_proc_token &) const =default;
    };

    enum class env_change_type: uint8_t {
        database = 1,
        language = 2,
        charset = 3,
        packet_size = 4,
        sql_collation = 7,
        begin_txn = 8,
        commit_txn = 9,
        rollback_txn = 10,
        database_mirroring_partner = 13,
        reset_connection = 18,
        routing_change = 20
    };

    struct routing_info {
        uint8_t protocol = 0;
        uint16_t port = 0;
        std::string server {};

        bool operator==(const routing_info &) const =default;
    };

    using env_value = std::variant<std::monostate, std::string, uint32_t, uint8_vector, routing_info>;

    struct env_change_token {
        // types without a dedicated decoding keep the raw payload as new_value
        env_change_type type {};
        env_value new_value {};
        env_value old_value {};

        bool operator==(const env_change_token &) const =default;
    };

    struct message_info {
        uint32_t number = 0;
        uint8_t state = 0;
        uint8_t clazz = 0;
        std::string message {};
        std::string server_name {};
        std::string proc_name {};
        uint32_t line_number = 0;

        bool operator==(const message_info &) const =default;
    };

    struct error_token: message_info {
        bool operator==(const error_token &) const =default;
    };

    struct info_token: message_info {
        bool operator==(const info_token &) const =default;
    };

    struct feature_ext_ack_token {
        static constexpr uint8_t feature_fedauth = 0x02;
        static constexpr uint8_t feature_terminator = 0xFF;

        std::map<uint8_t, uint8_vector> features {};
        std::optional<uint8_vector> fed_auth {};

        bool operator==(const feature_ext_ack_token &) const =default;
    };

    struct fedauth_info_token {
        static constexpr uint8_t info_stsurl = 0x01;
        static constexpr uint8_t info_spn = 0x02;

        std::optional<std::string> sts_url {};
        std::optional<std::string> spn {};

        bool operator==(const fedauth_info_token &) const =default;
    };

    struct prog_version {
        uint8_t major = 0;
        uint8_t minor = 0;
        uint8_t build_num_hi = 0;
        uint8_t build_num_low = 0;

        bool operator==(const prog_version &) const =default;
    };

    struct login_ack_token {
        std::string interface_name {};
        std::string protocol_version {};
        std::string prog_name {};
        prog_version version {};

        bool operator==(const login_ack_token &) const =default;
    };

    struct order_token {
        std::vector<uint16_t> columns {};

        bool operator==(const order_token &) const =default;
    };

    struct return_status_token {
        int32_t value = 0;

        bool operator==(const return_status_token &) const =default;
    };

    struct return_value_token {
        uint16_t param_ordinal = 0;
        std::string param_name {};
        uint8_t status = 0;
        column_metadata metadata {};
        column_value value {};

        bool operator==(const return_value_token &) const =default;
    };

    struct row_token {
        std::vector<column_value> columns {};

        bool operator==(const row_token &) const =default;
    };

    struct nbc_row_token {
        std::vector<column_value> columns {};

        bool operator==(const nbc_row_token &) const =default;
    };

    struct sspi_token {
        uint8_vector data {};

        bool operator==(const sspi_token &) const =default;
    };

    // Marks the end of a transport-level message and carries no payload
    struct end_of_message_token {
        bool operator==(const end_of_message_token &) const =default;
    };

    using token = std::variant<
        colmetadata_token,
        done_token,
        done_in_proc_token,
        done_proc_token,
        env_change_token,
        error_token,
        info_token,
        feature_ext_ack_token,
        fedauth_info_token,
        login_ack_token,
        order_token,
        return_status_token,
        return_value_token,
        row_token,
        nbc_row_token,
        sspi_token,
        end_of_message_token
    >;

    extern const char *token_name(const token &t);
    extern std::string describe(const token &t);
}

namespace fmt {
    template<>
    struct formatter<tds_stream::token>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", tds_stream::describe(v));
        }
    };
}

#endif // !TDS_STREAM_TOKEN_HPP
