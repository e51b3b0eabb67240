/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/logger.hpp>
#include <ts/token-parser.hpp>
#include <ts/tokens/registry.hpp>

namespace tds_stream {
    unknown_token_error::unknown_token_error(const uint8_t tag, const uint64_t offset):
        error { fmt::format("unknown token type 0x{:02X} at stream offset {}", tag, offset) },
        _tag { tag }, _offset { offset }
    {
    }

    parser::parser(token_observer observer, const parser_options &opts, column_list initial_columns):
        stream_reader { opts.max_field_size },
        _observer { std::move(observer) }, _opts { opts },
        _on_complete { [this](token &&t) { _complete(std::move(t)); } },
        _columns { std::move(initial_columns) }
    {
        if (!_observer) [[unlikely]]
            throw error("a token parser requires a token observer");
    }

    template<typename F>
    void parser::_guard(const F &f)
    {
        try {
            f();
        } catch (const std::exception &ex) {
            _failed = true;
            logger::error("token parser failed at stream offset {}: {}", offset(), ex.what());
            throw;
        }
    }

    void parser::write(chunk &&c)
    {
        std::visit([this](auto &&v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, tds_stream::end_of_message>) {
                end_of_message();
            } else {
                _write_bytes(std::move(v));
            }
        }, std::move(c));
    }

    void parser::write(uint8_vector &&bytes)
    {
        _write_bytes(std::move(bytes));
    }

    void parser::write(const buffer bytes)
    {
        _write_bytes(uint8_vector { bytes });
    }

    void parser::end_of_message()
    {
        logger::trace("end of message at stream offset {} suspended: {}", offset(), suspended());
        _guard([&] {
            _observer(end_of_message_token {});
        });
    }

    void parser::_write_bytes(uint8_vector &&bytes)
    {
        if (_failed) {
            logger::debug("discarding {} bytes received after a fatal error", bytes.size());
            return;
        }
        // append drops the consumed prefix of the window
        _stream_base += window().position();
        append(std::move(bytes));
        _guard([&] {
            if (suspended())
                resume();
            _dispatch();
        });
    }

    void parser::_dispatch()
    {
        while (!_failed && !suspended() && window().available() > 0) {
            const auto tag_offset = offset();
            read_uint8([&](const uint8_t tag) {
                const auto decode = tokens::find_decoder(tag);
                if (!decode) [[unlikely]]
                    throw unknown_token_error(tag, tag_offset);
                decode(*this, _columns, _opts, _on_complete);
            });
        }
    }

    void parser::_complete(token &&t)
    {
        if (const auto *meta = std::get_if<colmetadata_token>(&t); meta) {
            _columns = meta->columns;
            logger::debug("column metadata replaced: {} columns", _columns.size());
        }
        logger::trace("token {} completed at stream offset {}", token_name(t), offset());
        _observer(std::move(t));
    }
}
