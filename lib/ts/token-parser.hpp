/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_TOKEN_PARSER_HPP
#define TDS_STREAM_TOKEN_PARSER_HPP

#include <ts/config.hpp>
#include <ts/stream-reader.hpp>
#include <ts/token.hpp>

namespace tds_stream {
    struct unknown_token_error: error {
        unknown_token_error(uint8_t tag, uint64_t offset);

        uint8_t tag() const noexcept
        {
            return _tag;
        }

        uint64_t offset() const noexcept
        {
            return _offset;
        }
    private:
        uint8_t _tag;
        uint64_t _offset;
    };

    // The transport signals the end of a message out of band
    struct end_of_message {
        bool operator==(const end_of_message &) const =default;
    };

    using chunk = std::variant<uint8_vector, end_of_message>;
    using token_observer = std::function<void(token &&)>;
    using token_callback = std::function<void(token &&)>;

    /*
     * Decodes a stream of tokens delivered in chunks of arbitrary size and alignment.
     * The bytes are dispatched to the token decoders one token at a time. A token that is cut
     * by a chunk boundary is suspended and completed when the following chunk arrives.
     * After a fatal error the parser stops dispatching and drops all later bytes.
     */
    struct parser: stream_reader {
        explicit parser(token_observer observer, const parser_options &opts={}, column_list initial_columns={});

        void write(chunk &&c);
        void write(uint8_vector &&bytes);
        void write(buffer bytes);
        void end_of_message();

        bool failed() const noexcept
        {
            return _failed;
        }

        // the number of received bytes not yet consumed by a completed read
        size_t buffered() const noexcept
        {
            return window().available();
        }

        // the absolute stream offset of the next unread byte
        uint64_t offset() const noexcept
        {
            return _stream_base + window().position();
        }

        const column_list &colmetadata() const noexcept
        {
            return _columns;
        }

        const parser_options &options() const noexcept
        {
            return _opts;
        }
    private:
        const token_observer _observer;
        const parser_options _opts;
        const token_callback _on_complete;
        column_list _columns;
        uint64_t _stream_base = 0;
        bool _failed = false;

        void _write_bytes(uint8_vector &&bytes);
        void _dispatch();
        void _complete(token &&t);
        template<typename F>
        void _guard(const F &f);
    };

    using token_decoder = void (*)(parser &p, const column_list &cols, const parser_options &opts, const token_callback &done);
}

#endif // !TDS_STREAM_TOKEN_PARSER_HPP
