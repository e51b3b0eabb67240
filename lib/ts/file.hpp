/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_FILE_HPP
#define TDS_STREAM_FILE_HPP

#include <string>
#include <ts/common/bytes.hpp>

namespace tds_stream::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, buffer data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // Reads a capture stored either as raw bytes or as hex text with optional whitespace
    extern uint8_vector read_capture(const std::string &path, bool hex);

    // Removes the file on destruction
    struct tmp {
        explicit tmp(const std::string &name);
        tmp(const tmp &) =delete;
        ~tmp();

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !TDS_STREAM_FILE_HPP
