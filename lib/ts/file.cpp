/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <ts/file.hpp>
#include <ts/logger.hpp>

namespace tds_stream::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::FILE *f = std::fopen(path.c_str(), "rb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        const std::unique_ptr<std::FILE, decltype(&std::fclose)> f_guard { f, &std::fclose };
        const auto sz = std::filesystem::file_size(path);
        buf.resize(sz);
        if (sz > 0 && std::fread(buf.data(), 1, sz, f) != sz) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    void write(const std::string &path, const buffer data)
    {
        std::FILE *f = std::fopen(path.c_str(), "wb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        const std::unique_ptr<std::FILE, decltype(&std::fclose)> f_guard { f, &std::fclose };
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    uint8_vector read_capture(const std::string &path, const bool hex)
    {
        auto raw = read(path);
        if (!hex)
            return raw;
        std::string digits {};
        digits.reserve(raw.size());
        for (const auto c: raw) {
            if (!std::isspace(c))
                digits.push_back(static_cast<char>(c));
        }
        logger::debug("{}: {} hex digits", path, digits.size());
        return uint8_vector::from_hex(digits);
    }

    tmp::tmp(const std::string &name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
