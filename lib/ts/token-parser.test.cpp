/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <random>
#include <ts/tokens/registry.hpp>
#include <ts/tokens/test.hpp>

using namespace tds_stream;

namespace {
    struct recorder {
        std::vector<token> tokens {};
        parser p;

        explicit recorder(const parser_options &opts={}):
            p { [this](token &&t) { tokens.emplace_back(std::move(t)); }, opts }
        {
        }
    };

    // a login response followed by a small result set
    constexpr std::string_view session_hex =
        "E3" "1300" "04" "04" "3400300039003600" "04" "3400300039003600"
        "AD" "1000" "01" "74000004" "03" "530051004C00" "0F001002"
        "81" "0200" "00000000" "0100" "2604" "02" "49006400"
        "00000000" "0100" "E7" "FFFF" "0904D00034" "04" "4E0061006D006500"
        "D1" "042A000000" "0600000000000000" "04000000" "41004200" "02000000" "4300" "00000000"
        "D2" "02" "0407000000"
        "AB" "1A00" "D0000000" "01" "10" "0300" "420061006400" "03" "730072007600" "00" "05000000"
        "A9" "0200" "0100"
        "79" "00000000"
        "FD" "1000" "C100" "0200000000000000";
}

suite token_parser_suite = [] {
    "token_parser"_test = [] {
        "a session decodes the same for every chunk size"_test = [] {
            const auto toks = tokens::test_decode_any_chunking(session_hex);
            test_same(9, toks.size());
            test_same(std::string { "ENVCHANGE" }, std::string { token_name(toks.at(0)) });
            test_same(std::string { "LOGINACK" }, std::string { token_name(toks.at(1)) });
            test_same(token { row_token { { int64_t { 42 }, std::string { "ABC" } } } }, toks.at(3));
            test_same(token { nbc_row_token { { int64_t { 7 }, column_value {} } } }, toks.at(4));
            test_same(std::string { "DONE" }, std::string { token_name(toks.at(8)) });
        };
        "irregular partitions"_test = [] {
            const auto bytes = uint8_vector::from_hex(session_hex);
            const auto exp = tokens::test_decode(bytes, bytes.size());
            std::mt19937 rnd { 42 };
            for (size_t iter = 0; iter < 64; ++iter) {
                recorder r {};
                for (size_t off = 0; off < bytes.size(); ) {
                    const auto sz = std::min(bytes.size() - off, std::uniform_int_distribution<size_t> { 0, 17 }(rnd));
                    r.p.write(bytes.subbuf(off, sz));
                    off += sz;
                }
                if (!test_same(exp, r.tokens))
                    break;
            }
        };
        "sequencing across chunks"_test = [] {
            recorder r {};
            r.p.write(uint8_vector::from_hex("79" "0100"));
            expect(r.p.suspended());
            test_same(0, r.tokens.size());
            r.p.write(uint8_vector::from_hex("0000" "79" "02000000"));
            expect(!r.p.suspended());
            test_same(2, r.tokens.size());
            test_same(token { return_status_token { 1 } }, r.tokens.at(0));
            test_same(token { return_status_token { 2 } }, r.tokens.at(1));
        };
        "empty chunks are harmless"_test = [] {
            recorder r {};
            r.p.write(uint8_vector {});
            r.p.write(uint8_vector::from_hex("79"));
            r.p.write(uint8_vector {});
            expect(r.p.suspended());
            r.p.write(uint8_vector::from_hex("03000000"));
            test_same(1, r.tokens.size());
            test_same(0, r.p.buffered());
        };
        "end of message is emitted immediately"_test = [] {
            recorder r {};
            r.p.write(uint8_vector::from_hex("79" "0100"));
            const auto buffered = r.p.buffered();
            const auto needed = r.p.needed();
            r.p.write(chunk { end_of_message {} });
            test_same(1, r.tokens.size());
            expect(std::holds_alternative<end_of_message_token>(r.tokens.at(0)));
            expect(r.p.suspended());
            test_same(buffered, r.p.buffered());
            test_same(needed, r.p.needed());
            r.p.write(uint8_vector::from_hex("0000"));
            test_same(2, r.tokens.size());
            test_same(token { return_status_token { 1 } }, r.tokens.at(1));
            r.p.end_of_message();
            test_same(3, r.tokens.size());
            test_same(token { end_of_message_token {} }, r.tokens.at(2));
        };
        "consumed bytes are released"_test = [] {
            recorder r {};
            r.p.write(uint8_vector::from_hex("79" "01000000" "79" "02"));
            test_same(1, r.p.buffered());
            test_same(6, r.p.offset());
            r.p.write(uint8_vector::from_hex("000000"));
            test_same(0, r.p.buffered());
            test_same(10, r.p.offset());
            test_same(2, r.tokens.size());
        };
        "unknown tags halt dispatch"_test = [] {
            recorder r {};
            try {
                r.p.write(uint8_vector::from_hex("79" "05000000" "01" "79" "06000000"));
                expect(false) << "an unknown tag must fail";
            } catch (const unknown_token_error &ex) {
                test_same(1, ex.tag());
                test_same(5, ex.offset());
            }
            expect(r.p.failed());
            test_same(1, r.tokens.size());
            test_same(token { return_status_token { 5 } }, r.tokens.at(0));
            // later bytes are dropped without another report
            expect(nothrow([&] { r.p.write(uint8_vector::from_hex("79" "07000000")); }));
            test_same(1, r.tokens.size());
            r.p.end_of_message();
            test_same(2, r.tokens.size());
            expect(std::holds_alternative<end_of_message_token>(r.tokens.at(1)));
        };
        "every unregistered tag halts dispatch"_test = [] {
            size_t num_unregistered = 0;
            for (size_t tag = 0; tag < 256; ++tag) {
                if (tokens::find_decoder(static_cast<uint8_t>(tag)))
                    continue;
                ++num_unregistered;
                recorder r {};
                std::optional<uint8_t> reported_tag {};
                std::optional<uint64_t> reported_offset {};
                try {
                    r.p.write(uint8_vector::from_hex(fmt::format("79" "05000000" "{:02X}" "79" "06000000", tag)));
                } catch (const unknown_token_error &ex) {
                    reported_tag = ex.tag();
                    reported_offset = ex.offset();
                }
                expect(reported_tag == std::optional<uint8_t> { static_cast<uint8_t>(tag) }) << "tag" << tag;
                expect(reported_offset == std::optional<uint64_t> { 5 }) << "tag" << tag;
                expect(r.p.failed()) << "tag" << tag;
                if (!test_same(1, r.tokens.size()))
                    break;
                test_same(token { return_status_token { 5 } }, r.tokens.at(0));
            }
            test_same(256 - 16, num_unregistered);
        };
        "unknown tag after a suspended token"_test = [] {
            recorder r {};
            r.p.write(uint8_vector::from_hex("79" "0500"));
            expect(throws<unknown_token_error>([&] { r.p.write(uint8_vector::from_hex("0000" "00")); }));
            test_same(1, r.tokens.size());
            expect(r.p.failed());
        };
        "decoder errors stop the parser"_test = [] {
            recorder r {};
            expect(throws<protocol_error>([&] { r.p.write(uint8_vector::from_hex("A9" "0300")); }));
            expect(r.p.failed());
            expect(nothrow([&] { r.p.write(uint8_vector::from_hex("79" "07000000")); }));
            test_same(0, r.tokens.size());
        };
        "oversized fields are rejected"_test = [] {
            parser_options opts {};
            opts.max_field_size = 16;
            recorder r { opts };
            expect(throws<protocol_error>([&] { r.p.write(uint8_vector::from_hex("ED" "1100")); }));
            expect(r.p.failed());
        };
        "observer errors propagate"_test = [] {
            size_t calls = 0;
            parser p { [&](token &&) {
                ++calls;
                throw error("observer failure");
            } };
            expect(throws<error>([&] { p.write(uint8_vector::from_hex("79" "01000000" "79" "02000000")); }));
            test_same(1, calls);
            expect(p.failed());
        };
        "a parser requires an observer"_test = [] {
            expect(throws<error>([] { parser p { token_observer {} }; }));
        };
        "a truncated stream stays suspended"_test = [] {
            recorder r {};
            r.p.write(uint8_vector::from_hex("FD" "1000" "C100" "020000"));
            expect(r.p.suspended());
            test_same(8, r.p.needed());
            test_same(0, r.tokens.size());
            expect(!r.p.failed());
        };
        "options are kept"_test = [] {
            parser_options opts {};
            opts.version = tds_version::v7_1;
            recorder r { opts };
            expect(r.p.options().version == tds_version::v7_1);
            test_same(opts.max_field_size, r.p.max_field_size());
            r.p.write(uint8_vector::from_hex("FD" "1000" "C100" "02000000"));
            test_same(1, r.tokens.size());
        };
        "describe"_test = [] {
            test_same(std::string { "RETURNSTATUS value: -2" }, describe(return_status_token { -2 }));
            test_same(std::string { "END_OF_MESSAGE" }, describe(end_of_message_token {}));
            test_same(std::string { "ROW [42, 'Hi', NULL]" }, describe(row_token { { int64_t { 42 }, std::string { "Hi" }, column_value {} } }));
        };
    };
};
