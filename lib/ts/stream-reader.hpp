/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_STREAM_READER_HPP
#define TDS_STREAM_STREAM_READER_HPP

/*
 * A suspendable reader of primitive values over a byte stream delivered in chunks.
 *
 * Every read is written in the continuation-passing style: the value is passed to a callback
 * once enough bytes are available. When a chunk ends before a value is complete, the reader
 * stores a single continuation and returns to its caller. The next call to resume() after more
 * bytes have been appended retries exactly the read that was interrupted.
 *
 * The 64-bit and wider integer readers return doubles. Their results are exact only for
 * magnitudes up to 2^53 and are rounded to the nearest representable double beyond that.
 * The signed 64-bit readers compute the two's complement value 2^32 * int32(high) + uint32(low),
 * so the low word is always added as an unsigned value regardless of the sign bit in byte 4.
 */

#include <bit>
#include <functional>
#include <memory>
#include <string>
#include <ts/byte-window.hpp>

namespace tds_stream {
    // Structurally invalid data in the stream
    struct protocol_error: error {
        using error::error;
    };

    struct stream_reader {
        static_assert(std::endian::native == std::endian::little);
        static constexpr size_t default_max_field_size = 64 << 20;

        using action = std::function<void()>;
        template<typename T>
        using callback = std::function<void(T)>;
        // the buffer stays valid only until the callback returns
        using buffer_callback = std::function<void(buffer)>;
        // the step calls the control with true to run another iteration or with false to stop
        using loop_control = std::function<void(bool)>;
        using loop_step = std::function<void(const loop_control &)>;
        using repeat_step = std::function<void(size_t, const action &)>;

        explicit stream_reader(size_t max_field_size=default_max_field_size);
        stream_reader(const stream_reader &) =delete;
        stream_reader(stream_reader &&) =delete;
        virtual ~stream_reader() =default;

        void append(uint8_vector &&chunk);
        void await_data(size_t num_bytes, action on_ready);
        void resume();

        bool suspended() const noexcept
        {
            return static_cast<bool>(_next);
        }

        // the number of unread bytes the pending continuation is waiting for
        size_t needed() const noexcept
        {
            return _next ? _needed : 0;
        }

        const byte_window &window() const noexcept
        {
            return _window;
        }

        size_t max_field_size() const noexcept
        {
            return _max_field_size;
        }

        void read_loop(loop_step step, action done);
        void read_repeat(size_t count, repeat_step step, action done);

        void read_int8(callback<int8_t> cb);
        void read_uint8(callback<uint8_t> cb);
        void read_int16_le(callback<int16_t> cb);
        void read_int16_be(callback<int16_t> cb);
        void read_uint16_le(callback<uint16_t> cb);
        void read_uint16_be(callback<uint16_t> cb);
        void read_int32_le(callback<int32_t> cb);
        void read_int32_be(callback<int32_t> cb);
        void read_uint32_le(callback<uint32_t> cb);
        void read_uint32_be(callback<uint32_t> cb);
        void read_int64_le(callback<double> cb);
        void read_int64_be(callback<double> cb);
        void read_uint64_le(callback<double> cb);
        void read_uint64_be(callback<double> cb);
        void read_float_le(callback<float> cb);
        void read_float_be(callback<float> cb);
        void read_double_le(callback<double> cb);
        void read_double_be(callback<double> cb);
        void read_uint24_le(callback<uint32_t> cb);
        void read_uint40_le(callback<uint64_t> cb);
        void read_unumeric64_le(callback<double> cb);
        void read_unumeric96_le(callback<double> cb);
        void read_unumeric128_le(callback<double> cb);

        void read_buffer(size_t num_bytes, buffer_callback cb);
        void read_b_var_byte(buffer_callback cb);
        void read_us_var_byte(buffer_callback cb);
        void read_b_var_char(callback<std::string> cb);
        void read_us_var_char(callback<std::string> cb);
    private:
        struct loop_state;

        byte_window _window {};
        action _next {};
        size_t _needed = 0;
        const size_t _max_field_size;

        template<typename T, typename D>
        void _read(size_t num_bytes, D decode, callback<T> cb);
        void _run_loop(const std::shared_ptr<loop_state> &st);
    };
}

#endif // !TDS_STREAM_STREAM_READER_HPP
