/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/logger.hpp>
#include <ts/stream-reader.hpp>
#include <ts/text.hpp>

namespace tds_stream {
    static constexpr double two_pow_32 = 4294967296.0;

    struct stream_reader::loop_state {
        loop_step step;
        action done;
        bool running = false;
        bool step_done = false;
        bool again = false;
    };

    stream_reader::stream_reader(const size_t max_field_size):
        _max_field_size { max_field_size }
    {
    }

    void stream_reader::append(uint8_vector &&chunk)
    {
        _window.append(std::move(chunk));
    }

    void stream_reader::await_data(const size_t num_bytes, action on_ready)
    {
        if (num_bytes > _max_field_size) [[unlikely]]
            throw protocol_error(fmt::format("a field of {} bytes at stream offset {} exceeds the limit of {} bytes",
                num_bytes, _window.position(), _max_field_size));
        if (_window.available() >= num_bytes) {
            on_ready();
            return;
        }
        if (_next) [[unlikely]]
            throw error(fmt::format("cannot wait for {} bytes: another read is already suspended", num_bytes));
        logger::trace("suspended waiting for {} bytes with {} available", num_bytes, _window.available());
        _needed = num_bytes;
        _next = [this, num_bytes, on_ready=std::move(on_ready)]() mutable {
            await_data(num_bytes, std::move(on_ready));
        };
    }

    void stream_reader::resume()
    {
        if (!_next) [[unlikely]]
            throw error("resume called while no read is suspended");
        auto next = std::move(_next);
        _next = nullptr;
        logger::trace("resuming a read of {} bytes with {} available", _needed, _window.available());
        next();
    }

    void stream_reader::_run_loop(const std::shared_ptr<loop_state> &st)
    {
        for (;;) {
            st->running = true;
            st->step_done = false;
            st->step([this, st](const bool again) {
                st->step_done = true;
                st->again = again;
                // an iteration completed from within resume() has no running loop to return to
                if (!st->running) {
                    if (again)
                        _run_loop(st);
                    else
                        st->done();
                }
            });
            st->running = false;
            if (!st->step_done)
                return;
            if (!st->again)
                break;
        }
        st->done();
    }

    void stream_reader::read_loop(loop_step step, action done)
    {
        auto st = std::make_shared<loop_state>();
        st->step = std::move(step);
        st->done = std::move(done);
        _run_loop(st);
    }

    void stream_reader::read_repeat(const size_t count, repeat_step step, action done)
    {
        if (count == 0) {
            done();
            return;
        }
        auto idx = std::make_shared<size_t>(0);
        read_loop([count, idx, step=std::move(step)](const loop_control &next) {
            const auto i = (*idx)++;
            step(i, [i, count, next] { next(i + 1 < count); });
        }, std::move(done));
    }

    template<typename T, typename D>
    void stream_reader::_read(const size_t num_bytes, D decode, callback<T> cb)
    {
        await_data(num_bytes, [this, num_bytes, decode=std::move(decode), cb=std::move(cb)] {
            const T val = decode(_window.peek(num_bytes));
            _window.advance(num_bytes);
            cb(val);
        });
    }

    void stream_reader::read_int8(callback<int8_t> cb)
    {
        _read<int8_t>(1, [](const buffer b) { return b.to<int8_t>(); }, std::move(cb));
    }

    void stream_reader::read_uint8(callback<uint8_t> cb)
    {
        _read<uint8_t>(1, [](const buffer b) { return b[0]; }, std::move(cb));
    }

    void stream_reader::read_int16_le(callback<int16_t> cb)
    {
        _read<int16_t>(2, [](const buffer b) { return b.to<int16_t>(); }, std::move(cb));
    }

    void stream_reader::read_int16_be(callback<int16_t> cb)
    {
        _read<int16_t>(2, [](const buffer b) { return b.to_host<int16_t>(); }, std::move(cb));
    }

    void stream_reader::read_uint16_le(callback<uint16_t> cb)
    {
        _read<uint16_t>(2, [](const buffer b) { return b.to<uint16_t>(); }, std::move(cb));
    }

    void stream_reader::read_uint16_be(callback<uint16_t> cb)
    {
        _read<uint16_t>(2, [](const buffer b) { return b.to_host<uint16_t>(); }, std::move(cb));
    }

    void stream_reader::read_int32_le(callback<int32_t> cb)
    {
        _read<int32_t>(4, [](const buffer b) { return b.to<int32_t>(); }, std::move(cb));
    }

    void stream_reader::read_int32_be(callback<int32_t> cb)
    {
        _read<int32_t>(4, [](const buffer b) { return b.to_host<int32_t>(); }, std::move(cb));
    }

    void stream_reader::read_uint32_le(callback<uint32_t> cb)
    {
        _read<uint32_t>(4, [](const buffer b) { return b.to<uint32_t>(); }, std::move(cb));
    }

    void stream_reader::read_uint32_be(callback<uint32_t> cb)
    {
        _read<uint32_t>(4, [](const buffer b) { return b.to_host<uint32_t>(); }, std::move(cb));
    }

    void stream_reader::read_int64_le(callback<double> cb)
    {
        _read<double>(8, [](const buffer b) {
            const auto lo = b.subbuf(0, 4).to<uint32_t>();
            const auto hi = b.subbuf(4, 4).to<int32_t>();
            return two_pow_32 * hi + lo;
        }, std::move(cb));
    }

    void stream_reader::read_int64_be(callback<double> cb)
    {
        _read<double>(8, [](const buffer b) {
            const auto hi = b.subbuf(0, 4).to_host<int32_t>();
            const auto lo = b.subbuf(4, 4).to_host<uint32_t>();
            return two_pow_32 * hi + lo;
        }, std::move(cb));
    }

    void stream_reader::read_uint64_le(callback<double> cb)
    {
        _read<double>(8, [](const buffer b) {
            const auto lo = b.subbuf(0, 4).to<uint32_t>();
            const auto hi = b.subbuf(4, 4).to<uint32_t>();
            return two_pow_32 * hi + lo;
        }, std::move(cb));
    }

    void stream_reader::read_uint64_be(callback<double> cb)
    {
        _read<double>(8, [](const buffer b) {
            const auto hi = b.subbuf(0, 4).to_host<uint32_t>();
            const auto lo = b.subbuf(4, 4).to_host<uint32_t>();
            return two_pow_32 * hi + lo;
        }, std::move(cb));
    }

    void stream_reader::read_float_le(callback<float> cb)
    {
        _read<float>(4, [](const buffer b) { return b.to<float>(); }, std::move(cb));
    }

    void stream_reader::read_float_be(callback<float> cb)
    {
        _read<float>(4, [](const buffer b) { return std::bit_cast<float>(b.to_host<uint32_t>()); }, std::move(cb));
    }

    void stream_reader::read_double_le(callback<double> cb)
    {
        _read<double>(8, [](const buffer b) { return b.to<double>(); }, std::move(cb));
    }

    void stream_reader::read_double_be(callback<double> cb)
    {
        _read<double>(8, [](const buffer b) { return std::bit_cast<double>(b.to_host<uint64_t>()); }, std::move(cb));
    }

    void stream_reader::read_uint24_le(callback<uint32_t> cb)
    {
        _read<uint32_t>(3, [](const buffer b) {
            const uint32_t lo = b.subbuf(0, 2).to<uint16_t>();
            const uint32_t hi = b[2];
            return lo | (hi << 16);
        }, std::move(cb));
    }

    void stream_reader::read_uint40_le(callback<uint64_t> cb)
    {
        _read<uint64_t>(5, [](const buffer b) {
            const uint64_t lo = b.subbuf(0, 4).to<uint32_t>();
            const uint64_t hi = b[4];
            return lo | (hi << 32);
        }, std::move(cb));
    }

    void stream_reader::read_unumeric64_le(callback<double> cb)
    {
        read_uint64_le(std::move(cb));
    }

    void stream_reader::read_unumeric96_le(callback<double> cb)
    {
        _read<double>(12, [](const buffer b) {
            const auto w1 = b.subbuf(0, 4).to<uint32_t>();
            const auto w2 = b.subbuf(4, 4).to<uint32_t>();
            const auto w3 = b.subbuf(8, 4).to<uint32_t>();
            return w1 + two_pow_32 * w2 + two_pow_32 * two_pow_32 * w3;
        }, std::move(cb));
    }

    void stream_reader::read_unumeric128_le(callback<double> cb)
    {
        _read<double>(16, [](const buffer b) {
            const auto w1 = b.subbuf(0, 4).to<uint32_t>();
            const auto w2 = b.subbuf(4, 4).to<uint32_t>();
            const auto w3 = b.subbuf(8, 4).to<uint32_t>();
            const auto w4 = b.subbuf(12, 4).to<uint32_t>();
            return w1 + two_pow_32 * w2 + two_pow_32 * two_pow_32 * w3 + two_pow_32 * two_pow_32 * two_pow_32 * w4;
        }, std::move(cb));
    }

    void stream_reader::read_buffer(const size_t num_bytes, buffer_callback cb)
    {
        await_data(num_bytes, [this, num_bytes, cb=std::move(cb)] {
            const auto data = _window.peek(num_bytes);
            _window.advance(num_bytes);
            cb(data);
        });
    }

    void stream_reader::read_b_var_byte(buffer_callback cb)
    {
        read_uint8([this, cb=std::move(cb)](const uint8_t len) {
            read_buffer(len, cb);
        });
    }

    void stream_reader::read_us_var_byte(buffer_callback cb)
    {
        read_uint16_le([this, cb=std::move(cb)](const uint16_t len) {
            read_buffer(len, cb);
        });
    }

    void stream_reader::read_b_var_char(callback<std::string> cb)
    {
        read_uint8([this, cb=std::move(cb)](const uint8_t len) {
            read_buffer(size_t { len } * 2, [cb](const buffer data) {
                cb(text::from_ucs2(data));
            });
        });
    }

    void stream_reader::read_us_var_char(callback<std::string> cb)
    {
        read_uint16_le([this, cb=std::move(cb)](const uint16_t len) {
            read_buffer(size_t { len } * 2, [cb](const buffer data) {
                cb(text::from_ucs2(data));
            });
        });
    }
}
