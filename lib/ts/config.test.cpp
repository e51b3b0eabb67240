/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/common/test.hpp>
#include <ts/config.hpp>

using namespace tds_stream;

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const parser_options opts {};
            expect(opts.version == tds_version::v7_4);
            expect(!opts.camel_case_columns);
            expect(!opts.lower_case_guids);
            test_same(64 << 20, opts.max_field_size);
        };
        "from_json"_test = [] {
            const config_json cfg { json::object {
                { "tdsVersion", "7_1" },
                { "camelCaseColumns", true },
                { "lowerCaseGuids", true },
                { "maxFieldSize", 1024 },
                { "someOtherKey", "ignored" }
            } };
            const auto opts = parser_options::from_config(cfg);
            expect(opts.version == tds_version::v7_1);
            expect(!opts.at_least(tds_version::v7_2));
            expect(opts.camel_case_columns);
            expect(opts.lower_case_guids);
            test_same(1024, opts.max_field_size);
        };
        "ill-typed values"_test = [] {
            expect(throws<error>([] { parser_options::from_json(json::object { { "camelCaseColumns", "yes" } }); }));
            expect(throws<error>([] { parser_options::from_json(json::object { { "tdsVersion", 74 } }); }));
            expect(throws<error>([] { parser_options::from_json(json::object { { "tdsVersion", "8_0" } }); }));
            expect(throws<error>([] { parser_options::from_json(json::object { { "maxFieldSize", -1 } }); }));
        };
        "version names"_test = [] {
            test_same(std::string { "7_3_B" }, std::string { tds_version_name(tds_version::v7_3_b) });
            test_same(std::string { "7_2" }, tds_version_name(0x72090002U));
            test_same(std::string { "0x01020304" }, tds_version_name(0x01020304U));
        };
        "config_file"_test = [] {
            file::tmp tmp_f { "ts-config-test.json" };
            file::write(tmp_f.path(), buffer { std::string_view { R"({ "tdsVersion": "7_3_A", "lowerCaseGuids": true })" } });
            const config_file cfg { tmp_f.path() };
            test_same(std::string_view { "7_3_A" }, static_cast<std::string_view>(cfg.at("tdsVersion").as_string()));
            expect(cfg.find("camelCaseColumns") == nullptr);
            expect(throws<error>([&] { static_cast<void>(cfg.at("camelCaseColumns")); }));
            const auto opts = parser_options::from_config(cfg);
            expect(opts.version == tds_version::v7_3_a);
            expect(opts.lower_case_guids);
        };
        "config_file missing"_test = [] {
            expect(throws<error_sys>([] { config_file { "/nonexistent/ts-config.json" }; }));
        };
    };
};
