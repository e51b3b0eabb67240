/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/tokens/registry.hpp>
#include <ts/tokens/value.hpp>

namespace tds_stream::tokens {
    void decode_return_value(parser &p, const column_list &, const parser_options &opts, const token_callback &done)
    {
        auto res = std::make_shared<return_value_token>();
        p.read_uint16_le([&p, &opts, done, res](const uint16_t ordinal) {
            res->param_ordinal = ordinal;
            p.read_b_var_char([&p, &opts, done, res](std::string name) {
                if (!name.empty() && name[0] == '@')
                    name.erase(0, 1);
                res->param_name = std::move(name);
                p.read_uint8([&p, &opts, done, res](const uint8_t status) {
                    res->status = status;
                    read_column_metadata(p, opts, [&p, &opts, done, res](column_metadata meta) {
                        res->metadata = std::move(meta);
                        res->metadata.name = res->param_name;
                        // res owns the metadata for the duration of the value read
                        read_value(p, res->metadata, opts, [done, res](column_value v) {
                            res->value = std::move(v);
                            done(std::move(*res));
                        });
                    });
                });
            });
        });
    }
}
