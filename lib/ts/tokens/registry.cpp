/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <ts/tokens/registry.hpp>

namespace tds_stream::tokens {
    using decoder_table = std::array<token_decoder, 256>;

    static constexpr decoder_table make_decoder_table()
    {
        decoder_table table {};
        const auto reg = [&](const token_type type, const token_decoder decode) {
            table[static_cast<uint8_t>(type)] = decode;
        };
        reg(token_type::colmetadata, decode_colmetadata);
        reg(token_type::row, decode_row);
        reg(token_type::nbcrow, decode_nbc_row);
        reg(token_type::done, decode_done);
        reg(token_type::doneproc, decode_done_proc);
        reg(token_type::doneinproc, decode_done_in_proc);
        reg(token_type::envchange, decode_env_change);
        reg(token_type::error, decode_error);
        reg(token_type::info, decode_info);
        reg(token_type::loginack, decode_login_ack);
        reg(token_type::order, decode_order);
        reg(token_type::returnstatus, decode_return_status);
        reg(token_type::returnvalue, decode_return_value);
        reg(token_type::featureextack, decode_feature_ext_ack);
        reg(token_type::fedauthinfo, decode_fedauth_info);
        reg(token_type::sspi, decode_sspi);
        return table;
    }

    static constexpr decoder_table decoders = make_decoder_table();

    token_decoder find_decoder(const uint8_t tag) noexcept
    {
        return decoders[tag];
    }
}
