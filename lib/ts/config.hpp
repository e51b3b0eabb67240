/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_CONFIG_HPP
#define TDS_STREAM_CONFIG_HPP

#include <ts/json.hpp>

namespace tds_stream {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            return _json_impl().if_contains(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] const buffer bytes() const
        {
            return _bytes_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
        virtual const buffer _bytes_impl() const =0;
    };

    // In-memory configuration, used by tests and to build options programmatically
    struct config_json: config {
        explicit config_json(json::object &&json):
            _json { std::move(json) }, _bytes { buffer { json::serialize(_json) } }
        {
        }
    private:
        const json::object _json;
        const uint8_vector _bytes;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error(fmt::format("config does not have the requested {} element!", name));
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }

        const buffer _bytes_impl() const override
        {
            return _bytes;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        uint8_vector _raw;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
        const buffer _bytes_impl() const override
        {
            return _raw;
        }
    };

    enum class tds_version: uint32_t {
        v7_0 = 0x70000000,
        v7_1 = 0x71000001,
        v7_2 = 0x72090002,
        v7_3_a = 0x730A0003,
        v7_3_b = 0x730B0003,
        v7_4 = 0x74000004
    };

    extern tds_version tds_version_from_string(std::string_view name);
    extern const char *tds_version_name(tds_version ver);
    // the name of a protocol version as reported by the server, unknown values are rendered in hex
    extern std::string tds_version_name(uint32_t ver);

    struct parser_options {
        tds_version version = tds_version::v7_4;
        // lower-cases the first letter of column names
        bool camel_case_columns = false;
        bool lower_case_guids = false;
        size_t max_field_size = 64 << 20;

        static parser_options from_json(const json::object &j);
        static parser_options from_config(const config &cfg);

        bool at_least(const tds_version ver) const noexcept
        {
            return static_cast<uint32_t>(version) >= static_cast<uint32_t>(ver);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<tds_stream::tds_version>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", tds_stream::tds_version_name(v));
        }
    };
}

#endif // !TDS_STREAM_CONFIG_HPP
