/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_TOKENS_REGISTRY_HPP
#define TDS_STREAM_TOKENS_REGISTRY_HPP

#include <ts/token-parser.hpp>

namespace tds_stream::tokens {
    extern void decode_colmetadata(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_row(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_nbc_row(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_done(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_done_proc(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_done_in_proc(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_env_change(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_error(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_info(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_login_ack(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_order(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_return_status(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_return_value(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_feature_ext_ack(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_fedauth_info(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
    extern void decode_sspi(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);

    // null for the tags without a decoder
    extern token_decoder find_decoder(uint8_t tag) noexcept;
}

#endif // !TDS_STREAM_TOKENS_REGISTRY_HPP
