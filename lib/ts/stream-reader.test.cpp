/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <optional>
#include <ts/common/test.hpp>
#include <ts/stream-reader.hpp>

using namespace tds_stream;

namespace {
    void feed(stream_reader &r, const buffer bytes)
    {
        r.append(uint8_vector { bytes });
        if (r.suspended())
            r.resume();
    }

    template<typename T>
    std::optional<T> read_all(const std::string_view hex, const std::function<void(stream_reader &, stream_reader::callback<T>)> &read)
    {
        stream_reader r {};
        std::optional<T> res {};
        r.append(uint8_vector::from_hex(hex));
        read(r, [&](T v) { res.emplace(std::move(v)); });
        expect(!r.suspended());
        test_same(0, r.window().available());
        return res;
    }

    uint8_vector le_bytes(uint64_t val, const size_t num_bytes)
    {
        uint8_vector res {};
        for (size_t i = 0; i < num_bytes; ++i) {
            res << static_cast<uint8_t>(val & 0xFF);
            val >>= 8;
        }
        return res;
    }
}

suite stream_reader_suite = [] {
    "stream_reader"_test = [] {
        "integers"_test = [] {
            test_same(-2, *read_all<int8_t>("FE", [](auto &r, auto cb) { r.read_int8(cb); }));
            test_same(0xFE, *read_all<uint8_t>("FE", [](auto &r, auto cb) { r.read_uint8(cb); }));
            test_same(-2, *read_all<int16_t>("FEFF", [](auto &r, auto cb) { r.read_int16_le(cb); }));
            test_same(-2, *read_all<int16_t>("FFFE", [](auto &r, auto cb) { r.read_int16_be(cb); }));
            test_same(0x0102, *read_all<uint16_t>("0201", [](auto &r, auto cb) { r.read_uint16_le(cb); }));
            test_same(0x0102, *read_all<uint16_t>("0102", [](auto &r, auto cb) { r.read_uint16_be(cb); }));
            test_same(-2, *read_all<int32_t>("FEFFFFFF", [](auto &r, auto cb) { r.read_int32_le(cb); }));
            test_same(-2, *read_all<int32_t>("FFFFFFFE", [](auto &r, auto cb) { r.read_int32_be(cb); }));
            test_same(0x01020304U, *read_all<uint32_t>("04030201", [](auto &r, auto cb) { r.read_uint32_le(cb); }));
            test_same(0x01020304U, *read_all<uint32_t>("01020304", [](auto &r, auto cb) { r.read_uint32_be(cb); }));
        };
        "int64"_test = [] {
            test_same(-4294967296.0, *read_all<double>("00000000FFFFFFFF", [](auto &r, auto cb) { r.read_int64_le(cb); }));
            test_same(-1.0, *read_all<double>("FFFFFFFFFFFFFFFF", [](auto &r, auto cb) { r.read_int64_le(cb); }));
            test_same(1.0, *read_all<double>("0100000000000000", [](auto &r, auto cb) { r.read_int64_le(cb); }));
            test_same(4294967297.0, *read_all<double>("0100000001000000", [](auto &r, auto cb) { r.read_int64_le(cb); }));
            // the low word stays unsigned even when the high word is negative or has bit 7 of byte 4 set
            test_same(549755813889.0, *read_all<double>("0100000080000000", [](auto &r, auto cb) { r.read_int64_le(cb); }));
            test_same(-4294967295.0, *read_all<double>("01000000FFFFFFFF", [](auto &r, auto cb) { r.read_int64_le(cb); }));
            test_same(-4294967296.0, *read_all<double>("FFFFFFFF00000000", [](auto &r, auto cb) { r.read_int64_be(cb); }));
            test_same(-2.0, *read_all<double>("FFFFFFFFFFFFFFFE", [](auto &r, auto cb) { r.read_int64_be(cb); }));
        };
        "uint64"_test = [] {
            test_same(4294967296.0, *read_all<double>("0000000001000000", [](auto &r, auto cb) { r.read_uint64_le(cb); }));
            test_same(4294967296.0, *read_all<double>("0000000100000000", [](auto &r, auto cb) { r.read_uint64_be(cb); }));
            // beyond 2^53 the value is rounded to the nearest double
            test_same(18446744073709551616.0, *read_all<double>("FFFFFFFFFFFFFFFF", [](auto &r, auto cb) { r.read_uint64_le(cb); }));
        };
        "floats"_test = [] {
            test_same(1.5F, *read_all<float>("0000C03F", [](auto &r, auto cb) { r.read_float_le(cb); }));
            test_same(1.5F, *read_all<float>("3FC00000", [](auto &r, auto cb) { r.read_float_be(cb); }));
            test_same(-2.25, *read_all<double>("00000000000002C0", [](auto &r, auto cb) { r.read_double_le(cb); }));
            test_same(-2.25, *read_all<double>("C002000000000000", [](auto &r, auto cb) { r.read_double_be(cb); }));
        };
        "extended width round trip"_test = [] {
            for (const uint64_t val: { 0ULL, 1ULL, 0xABCDEFULL, 0xFFFFFFULL }) {
                test_same(val, *read_all<uint32_t>(fmt::format("{}", le_bytes(val, 3)), [](auto &r, auto cb) { r.read_uint24_le(cb); }));
            }
            for (const uint64_t val: { 0ULL, 0x1FFFFFFFFULL, 0xFFFFFFFFFFULL }) {
                test_same(val, *read_all<uint64_t>(fmt::format("{}", le_bytes(val, 5)), [](auto &r, auto cb) { r.read_uint40_le(cb); }));
            }
            for (const uint64_t val: { 0ULL, 0x100000000ULL, 1ULL << 53 }) {
                const auto exp = static_cast<double>(val);
                test_same(exp, *read_all<double>(fmt::format("{}", le_bytes(val, 8)), [](auto &r, auto cb) { r.read_unumeric64_le(cb); }));
                test_same(exp, *read_all<double>(fmt::format("{}", le_bytes(val, 12)), [](auto &r, auto cb) { r.read_unumeric96_le(cb); }));
                test_same(exp, *read_all<double>(fmt::format("{}", le_bytes(val, 16)), [](auto &r, auto cb) { r.read_unumeric128_le(cb); }));
            }
            // the high words of 96 and 128-bit values are scaled by 2^64 and 2^96
            test_same(18446744073709551616.0, *read_all<double>("000000000000000001000000", [](auto &r, auto cb) { r.read_unumeric96_le(cb); }));
            test_same(79228162514264337593543950336.0, *read_all<double>("00000000000000000000000001000000", [](auto &r, auto cb) { r.read_unumeric128_le(cb); }));
        };
        "var byte"_test = [] {
            test_same(uint8_vector::from_hex("AABB"), *read_all<uint8_vector>("02AABB", [](auto &r, auto cb) {
                r.read_b_var_byte([cb](const buffer b) { cb(uint8_vector { b }); });
            }));
            test_same(uint8_vector::from_hex("AABBCC"), *read_all<uint8_vector>("0300AABBCC", [](auto &r, auto cb) {
                r.read_us_var_byte([cb](const buffer b) { cb(uint8_vector { b }); });
            }));
            test_same(uint8_vector {}, *read_all<uint8_vector>("00", [](auto &r, auto cb) {
                r.read_b_var_byte([cb](const buffer b) { cb(uint8_vector { b }); });
            }));
        };
        "var char"_test = [] {
            test_same(std::string { "ABC" }, *read_all<std::string>("03410042004300", [](auto &r, auto cb) { r.read_b_var_char(cb); }));
            test_same(std::string { "ABC" }, *read_all<std::string>("0300410042004300", [](auto &r, auto cb) { r.read_us_var_char(cb); }));
        };
        "suspends mid field and resumes"_test = [] {
            stream_reader r {};
            std::optional<uint32_t> res {};
            r.read_uint32_le([&](const uint32_t v) { res = v; });
            expect(r.suspended());
            test_same(4, r.needed());
            feed(r, uint8_vector::from_hex("04"));
            expect(r.suspended());
            feed(r, uint8_vector::from_hex("0302"));
            expect(r.suspended());
            test_same(3, r.window().available());
            expect(!res);
            feed(r, uint8_vector::from_hex("01FF"));
            expect(!r.suspended());
            test_same(0x01020304U, *res);
            test_same(1, r.window().available());
        };
        "resume with insufficient data suspends again"_test = [] {
            stream_reader r {};
            size_t calls = 0;
            r.read_us_var_char([&](const std::string &s) {
                ++calls;
                test_same(std::string { "AB" }, s);
            });
            expect(r.suspended());
            feed(r, uint8_vector::from_hex("02"));
            expect(r.suspended());
            test_same(2, r.needed());
            feed(r, uint8_vector::from_hex("00"));
            // the length is known now, so the requirement switches to the text bytes
            expect(r.suspended());
            test_same(4, r.needed());
            test_same(0, r.window().available());
            feed(r, uint8_vector::from_hex("4100"));
            expect(r.suspended());
            test_same(2, r.window().available());
            test_same(0, calls);
            feed(r, uint8_vector::from_hex("4200"));
            expect(!r.suspended());
            test_same(1, calls);
        };
        "resume without a suspended read"_test = [] {
            stream_reader r {};
            expect(throws([&] { r.resume(); }));
        };
        "a second suspension is rejected"_test = [] {
            stream_reader r {};
            r.read_uint8([](uint8_t) {});
            expect(r.suspended());
            expect(throws([&] { r.read_uint16_le([](uint16_t) {}); }));
        };
        "oversized fields fail fast"_test = [] {
            stream_reader r { 16 };
            expect(throws<protocol_error>([&] { r.read_buffer(17, [](buffer) {}); }));
            expect(!r.suspended());
            expect(nothrow([&] { r.read_buffer(16, [](buffer) {}); }));
            expect(r.suspended());
        };
        "read_repeat"_test = [] {
            stream_reader r {};
            std::vector<uint16_t> vals {};
            bool done = false;
            r.read_repeat(3, [&](size_t, const stream_reader::action &next) {
                r.read_uint16_le([&vals, next](const uint16_t v) {
                    vals.emplace_back(v);
                    next();
                });
            }, [&] { done = true; });
            expect(r.suspended());
            feed(r, uint8_vector::from_hex("010002"));
            expect(r.suspended());
            test_same(1, vals.size());
            feed(r, uint8_vector::from_hex("0003"));
            expect(r.suspended());
            feed(r, uint8_vector::from_hex("00"));
            expect(!r.suspended());
            expect(done);
            test_same(std::vector<uint16_t> { 1, 2, 3 }, vals);
        };
        "read_repeat zero"_test = [] {
            stream_reader r {};
            bool done = false;
            r.read_repeat(0, [](size_t, const stream_reader::action &) { throw error("must not be called"); }, [&] { done = true; });
            expect(done);
        };
        "read_repeat long synchronous run"_test = [] {
            static constexpr size_t num_items = 1 << 20;
            stream_reader r {};
            r.append(uint8_vector(num_items));
            size_t cnt = 0;
            bool done = false;
            r.read_repeat(num_items, [&](size_t, const stream_reader::action &next) {
                r.read_uint8([&cnt, next](uint8_t) {
                    ++cnt;
                    next();
                });
            }, [&] { done = true; });
            expect(done);
            test_same(num_items, cnt);
        };
        "read_loop until a terminator"_test = [] {
            stream_reader r {};
            std::vector<uint8_t> ids {};
            bool done = false;
            r.read_loop([&](const stream_reader::loop_control &next) {
                r.read_uint8([&ids, next](const uint8_t id) {
                    if (id == 0xFF) {
                        next(false);
                    } else {
                        ids.emplace_back(id);
                        next(true);
                    }
                });
            }, [&] { done = true; });
            feed(r, uint8_vector::from_hex("0102"));
            expect(!done);
            feed(r, uint8_vector::from_hex("03FF04"));
            expect(done);
            test_same(std::vector<uint8_t> { 1, 2, 3 }, ids);
            test_same(1, r.window().available());
        };
    };
};
