/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_TOKENS_VALUE_HPP
#define TDS_STREAM_TOKENS_VALUE_HPP

#include <ts/token-parser.hpp>

namespace tds_stream::tokens {
    extern void read_type_info(parser &p, stream_reader::callback<type_info> cb);
    // the user type, the flags and the type info shared by COLMETADATA and RETURNVALUE
    extern void read_column_metadata(parser &p, const parser_options &opts, stream_reader::callback<column_metadata> cb);
    extern void read_value(parser &p, const column_metadata &meta, const parser_options &opts, stream_reader::callback<column_value> cb);

    extern std::string format_date(int64_t days_since_epoch);
    extern std::string format_guid(buffer bytes, bool lower_case);
}

#endif // !TDS_STREAM_TOKENS_VALUE_HPP
