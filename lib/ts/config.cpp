/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <ts/config.hpp>
#include <ts/logger.hpp>

namespace tds_stream {
    config_file::config_file(const std::string &path):
        _path { path }, _raw { file::read(path) }, _parsed { json::as_object(json::parse(_raw), path) }
    {
        logger::debug("loaded configuration from {}", _path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }

    struct version_name {
        tds_version ver;
        const char *name;
    };

    static constexpr std::array<version_name, 6> version_names {
        version_name { tds_version::v7_0, "7_0" },
        version_name { tds_version::v7_1, "7_1" },
        version_name { tds_version::v7_2, "7_2" },
        version_name { tds_version::v7_3_a, "7_3_A" },
        version_name { tds_version::v7_3_b, "7_3_B" },
        version_name { tds_version::v7_4, "7_4" }
    };

    tds_version tds_version_from_string(const std::string_view name)
    {
        for (const auto &vn: version_names) {
            if (name == vn.name)
                return vn.ver;
        }
        throw error(fmt::format("unsupported TDS version: '{}'", name));
    }

    const char *tds_version_name(const tds_version ver)
    {
        for (const auto &vn: version_names) {
            if (ver == vn.ver)
                return vn.name;
        }
        throw error(fmt::format("unsupported TDS version: 0x{:08X}", static_cast<uint32_t>(ver)));
    }

    std::string tds_version_name(const uint32_t ver)
    {
        for (const auto &vn: version_names) {
            if (ver == static_cast<uint32_t>(vn.ver))
                return vn.name;
        }
        return fmt::format("0x{:08X}", ver);
    }

    static bool bool_option(const json::value &v, const std::string_view name)
    {
        if (!v.is_bool()) [[unlikely]]
            throw error(fmt::format("option {} must be a boolean but got: {}", name, json::serialize(v)));
        return v.get_bool();
    }

    parser_options parser_options::from_json(const json::object &j)
    {
        parser_options opts {};
        for (const auto &[key, val]: j) {
            if (key == "tdsVersion") {
                if (!val.is_string()) [[unlikely]]
                    throw error(fmt::format("option tdsVersion must be a string but got: {}", json::serialize(val)));
                opts.version = tds_version_from_string(static_cast<std::string_view>(val.get_string()));
            } else if (key == "camelCaseColumns") {
                opts.camel_case_columns = bool_option(val, key);
            } else if (key == "lowerCaseGuids") {
                opts.lower_case_guids = bool_option(val, key);
            } else if (key == "maxFieldSize") {
                if (!val.is_uint64() && !(val.is_int64() && val.get_int64() > 0)) [[unlikely]]
                    throw error(fmt::format("option maxFieldSize must be a positive integer but got: {}", json::serialize(val)));
                opts.max_field_size = json::value_to<size_t>(val);
            } else {
                logger::debug("ignoring an unknown parser option: {}", static_cast<std::string_view>(key));
            }
        }
        return opts;
    }

    parser_options parser_options::from_config(const config &cfg)
    {
        return from_json(cfg.json());
    }
}
