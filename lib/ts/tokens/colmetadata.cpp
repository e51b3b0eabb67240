/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <ts/tokens/registry.hpp>
#include <ts/tokens/value.hpp>

namespace tds_stream::tokens {
    // the column count reported when a result has no metadata
    static constexpr uint16_t no_metadata = 0xFFFF;

    static std::string column_name(std::string name, const bool camel_case)
    {
        if (camel_case && !name.empty() && static_cast<unsigned char>(name[0]) < 0x80)
            name[0] = static_cast<char>(std::tolower(name[0]));
        return name;
    }

    void decode_colmetadata(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        p.read_uint16_le([&p, &opts, done](const uint16_t count) {
            auto res = std::make_shared<colmetadata_token>();
            const size_t num_cols = count == no_metadata ? 0 : count;
            res->columns.reserve(num_cols);
            p.read_repeat(num_cols, [&p, &opts, res](size_t, const stream_reader::action &next) {
                read_column_metadata(p, opts, [&p, &opts, res, next](column_metadata meta) {
                    p.read_b_var_char([&opts, res, next, meta=std::move(meta)](std::string name) mutable {
                        meta.name = column_name(std::move(name), opts.camel_case_columns);
                        res->columns.emplace_back(std::move(meta));
                        next();
                    });
                });
            }, [res, done] {
                done(std::move(*res));
            });
        });
    }
}
