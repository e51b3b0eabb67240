/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_BYTE_WINDOW_HPP
#define TDS_STREAM_BYTE_WINDOW_HPP

#include <ts/common/bytes.hpp>

namespace tds_stream {
    /*
     * Holds the bytes received but not yet consumed together with the read cursor.
     * Each append is a compaction point: the already consumed prefix is dropped,
     * so the retained memory never exceeds the largest unconsumed tail plus the new chunk.
     */
    struct byte_window {
        byte_window() =default;
        byte_window(const byte_window &) =delete;

        void append(uint8_vector &&chunk)
        {
            if (_pos == _data.size()) {
                _data = std::move(chunk);
            } else {
                uint8_vector data {};
                data.reserve(available() + chunk.size());
                data << unread() << chunk;
                _data = std::move(data);
            }
            _pos = 0;
        }

        void advance(const size_t num_bytes)
        {
            if (num_bytes > available()) [[unlikely]]
                throw error(fmt::format("cannot advance by {} bytes when only {} are available", num_bytes, available()));
            _pos += num_bytes;
        }

        // the next sz unread bytes
        buffer peek(const size_t sz) const
        {
            return unread().subbuf(0, sz);
        }

        buffer unread() const noexcept
        {
            return { _data.data() + _pos, available() };
        }

        size_t available() const noexcept
        {
            return _data.size() - _pos;
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        size_t size() const noexcept
        {
            return _data.size();
        }

        const uint8_t *data() const noexcept
        {
            return _data.data();
        }
    private:
        uint8_vector _data {};
        size_t _pos = 0;
    };
}

#endif // !TDS_STREAM_BYTE_WINDOW_HPP
