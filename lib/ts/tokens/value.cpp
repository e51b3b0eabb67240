/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <cmath>
#include <ts/text.hpp>
#include <ts/tokens/value.hpp>

namespace tds_stream {
    const char *data_type_name(const data_type type)
    {
        switch (type) {
            case data_type::null_type: return "NULL";
            case data_type::guid: return "UNIQUEIDENTIFIER";
            case data_type::intn: return "INTN";
            case data_type::daten: return "DATE";
            case data_type::timen: return "TIME";
            case data_type::datetime2n: return "DATETIME2";
            case data_type::datetimeoffsetn: return "DATETIMEOFFSET";
            case data_type::int1: return "TINYINT";
            case data_type::bit: return "BIT";
            case data_type::int2: return "SMALLINT";
            case data_type::int4: return "INT";
            case data_type::datetim4: return "SMALLDATETIME";
            case data_type::flt4: return "REAL";
            case data_type::money: return "MONEY";
            case data_type::datetime: return "DATETIME";
            case data_type::flt8: return "FLOAT";
            case data_type::bitn: return "BITN";
            case data_type::decimaln: return "DECIMALN";
            case data_type::numericn: return "NUMERICN";
            case data_type::fltn: return "FLTN";
            case data_type::moneyn: return "MONEYN";
            case data_type::datetimn: return "DATETIMN";
            case data_type::money4: return "SMALLMONEY";
            case data_type::int8: return "BIGINT";
            case data_type::bigvarbinary: return "VARBINARY";
            case data_type::bigvarchar: return "VARCHAR";
            case data_type::bigbinary: return "BINARY";
            case data_type::bigchar: return "CHAR";
            case data_type::nvarchar: return "NVARCHAR";
            case data_type::nchar: return "NCHAR";
            default: return "UNKNOWN";
        }
    }
}

namespace tds_stream::tokens {
    static constexpr uint16_t charbin_null = 0xFFFF;
    static constexpr uint64_t plp_null = 0xFFFFFFFFFFFFFFFFULL;
    // 1900-01-01 and 0001-01-01 relative to 1970-01-01
    static constexpr int64_t datetime_epoch_days = -25567;
    static constexpr int64_t date_epoch_days = -719162;
    static constexpr int64_t ms_per_day = 86400000;

    std::string format_date(const int64_t days_since_epoch)
    {
        const int64_t z = days_since_epoch + 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const int64_t doe = z - era * 146097;
        const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const int64_t mp = (5 * doy + 2) / 153;
        const int64_t d = doy - (153 * mp + 2) / 5 + 1;
        const int64_t m = mp < 10 ? mp + 3 : mp - 9;
        const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
        return fmt::format("{:04}-{:02}-{:02}", y, m, d);
    }

    static std::string format_datetime(const int64_t days_since_epoch, const int64_t ms_of_day)
    {
        const auto secs = ms_of_day / 1000;
        return fmt::format("{}T{:02}:{:02}:{:02}.{:03}", format_date(days_since_epoch),
            secs / 3600, secs / 60 % 60, secs % 60, ms_of_day % 1000);
    }

    static constexpr uint8_t max_time_scale = 7;

    static uint64_t scale_divisor(const uint8_t scale)
    {
        uint64_t div = 1;
        for (uint8_t i = 0; i < scale; ++i)
            div *= 10;
        return div;
    }

    static std::string format_time(const uint64_t units, const uint8_t scale)
    {
        const auto div = scale_divisor(scale);
        const auto secs = units / div;
        auto res = fmt::format("{:02}:{:02}:{:02}", secs / 3600, secs / 60 % 60, secs % 60);
        if (scale > 0)
            res += fmt::format(".{:0{}}", units % div, scale);
        return res;
    }

    // the stored time and date are in UTC, the rendered value is the local time with its offset
    static std::string format_datetime_offset(int64_t days, const uint64_t units, const uint8_t scale, const int16_t offset_mins)
    {
        const auto div = static_cast<int64_t>(scale_divisor(scale));
        const int64_t units_per_day = 86400 * div;
        int64_t local = static_cast<int64_t>(units) + int64_t { offset_mins } * 60 * div;
        if (local < 0) {
            local += units_per_day;
            --days;
        } else if (local >= units_per_day) {
            local -= units_per_day;
            ++days;
        }
        const int abs_offset = offset_mins < 0 ? -offset_mins : offset_mins;
        return fmt::format("{}T{}{}{:02}:{:02}", format_date(days), format_time(static_cast<uint64_t>(local), scale),
            offset_mins < 0 ? '-' : '+', abs_offset / 60, abs_offset % 60);
    }

    std::string format_guid(const buffer bytes, const bool lower_case)
    {
        if (bytes.size() != 16) [[unlikely]]
            throw protocol_error(fmt::format("a GUID must have 16 bytes but got {}", bytes.size()));
        // the first three groups are stored in the little-endian order
        auto res = fmt::format("{:08X}-{:04X}-{:04X}-{}-{}",
            bytes.subbuf(0, 4).to<uint32_t>(), bytes.subbuf(4, 2).to<uint16_t>(), bytes.subbuf(6, 2).to<uint16_t>(),
            bytes.subbuf(8, 2), bytes.subbuf(10, 6));
        if (lower_case) {
            for (auto &c: res)
                c = static_cast<char>(std::tolower(c));
        }
        return res;
    }

    static void read_collation(parser &p, stream_reader::callback<collation> cb)
    {
        p.read_buffer(5, [cb=std::move(cb)](const buffer b) {
            cb(collation { b.subbuf(0, 4).to<uint32_t>(), b[4] });
        });
    }

    void read_type_info(parser &p, stream_reader::callback<type_info> cb)
    {
        p.read_uint8([&p, cb=std::move(cb)](const uint8_t type_id) {
            type_info ti {};
            ti.type = static_cast<data_type>(type_id);
            switch (ti.type) {
                case data_type::null_type:
                case data_type::int1:
                case data_type::bit:
                case data_type::int2:
                case data_type::int4:
                case data_type::datetim4:
                case data_type::flt4:
                case data_type::money:
                case data_type::datetime:
                case data_type::flt8:
                case data_type::money4:
                case data_type::int8:
                case data_type::daten:
                    cb(std::move(ti));
                    break;
                case data_type::intn:
                case data_type::bitn:
                case data_type::fltn:
                case data_type::moneyn:
                case data_type::datetimn:
                case data_type::guid:
                    p.read_uint8([cb, ti](const uint8_t len) mutable {
                        ti.data_length = len;
                        cb(std::move(ti));
                    });
                    break;
                case data_type::decimaln:
                case data_type::numericn:
                    p.read_buffer(3, [cb, ti](const buffer b) mutable {
                        ti.data_length = b[0];
                        ti.precision = b[1];
                        ti.scale = b[2];
                        cb(std::move(ti));
                    });
                    break;
                case data_type::timen:
                case data_type::datetime2n:
                case data_type::datetimeoffsetn:
                    p.read_uint8([cb, ti](const uint8_t scale) mutable {
                        if (scale > max_time_scale) [[unlikely]]
                            throw protocol_error(fmt::format("invalid {} scale: {}", data_type_name(ti.type), scale));
                        ti.scale = scale;
                        cb(std::move(ti));
                    });
                    break;
                case data_type::bigvarbinary:
                case data_type::bigbinary:
                    p.read_uint16_le([cb, ti](const uint16_t len) mutable {
                        ti.data_length = len;
                        cb(std::move(ti));
                    });
                    break;
                case data_type::bigvarchar:
                case data_type::bigchar:
                case data_type::nvarchar:
                case data_type::nchar:
                    p.read_uint16_le([&p, cb, ti](const uint16_t len) mutable {
                        ti.data_length = len;
                        read_collation(p, [cb, ti](const collation c) mutable {
                            ti.coll = c;
                            cb(std::move(ti));
                        });
                    });
                    break;
                default:
                    throw protocol_error(fmt::format("unsupported data type 0x{:02X} at stream offset {}", type_id, p.offset() - 1));
            }
        });
    }

    void read_column_metadata(parser &p, const parser_options &opts, stream_reader::callback<column_metadata> cb)
    {
        const auto after_user_type = [&p, cb=std::move(cb)](const uint32_t user_type) {
            p.read_uint16_le([&p, cb, user_type](const uint16_t flags) {
                read_type_info(p, [cb, user_type, flags](type_info ti) {
                    cb(column_metadata { user_type, flags, std::move(ti) });
                });
            });
        };
        if (opts.at_least(tds_version::v7_2))
            p.read_uint32_le(after_user_type);
        else
            p.read_uint16_le(after_user_type);
    }

    static column_value to_value(const type_info &ti, const buffer bytes)
    {
        switch (ti.type) {
            case data_type::bigvarchar:
            case data_type::bigchar:
                return text::from_latin1(bytes);
            case data_type::nvarchar:
            case data_type::nchar:
                return text::from_ucs2(bytes);
            default:
                return uint8_vector { bytes };
        }
    }

    static void read_plp(parser &p, const type_info ti, stream_reader::callback<column_value> cb)
    {
        p.read_buffer(8, [&p, ti, cb=std::move(cb)](const buffer len_b) {
            if (len_b.to<uint64_t>() == plp_null) {
                cb(column_value {});
                return;
            }
            // the total length may be unknown, so the chunks up to the terminator are what counts
            auto data = std::make_shared<uint8_vector>();
            p.read_loop([&p, data](const stream_reader::loop_control &next) {
                p.read_uint32_le([&p, data, next](const uint32_t chunk_len) {
                    if (chunk_len == 0) {
                        next(false);
                        return;
                    }
                    if (data->size() + chunk_len > p.max_field_size()) [[unlikely]]
                        throw protocol_error(fmt::format("a PLP value of more than {} bytes exceeds the limit of {} bytes",
                            data->size() + chunk_len, p.max_field_size()));
                    p.read_buffer(chunk_len, [data, next](const buffer b) {
                        *data << b;
                        next(true);
                    });
                });
            }, [ti, data, cb] {
                cb(to_value(ti, *data));
            });
        });
    }

    static void read_decimal(parser &p, const type_info ti, const uint8_t len, stream_reader::callback<column_value> cb)
    {
        p.read_uint8([&p, ti, len, cb=std::move(cb)](const uint8_t sign) {
            const auto finish = [ti, sign, cb](const double magnitude) {
                const auto val = magnitude / std::pow(10.0, ti.scale);
                cb(column_value { sign == 1 ? val : -val });
            };
            switch (len - 1) {
                case 4: p.read_uint32_le([finish](const uint32_t v) { finish(v); }); break;
                case 8: p.read_unumeric64_le(finish); break;
                case 12: p.read_unumeric96_le(finish); break;
                case 16: p.read_unumeric128_le(finish); break;
                default:
                    throw protocol_error(fmt::format("unsupported decimal value length: {}", len));
            }
        });
    }

    static void read_money8(parser &p, stream_reader::callback<column_value> cb)
    {
        p.read_int32_le([&p, cb=std::move(cb)](const int32_t hi) {
            p.read_uint32_le([cb, hi](const uint32_t lo) {
                cb(column_value { (4294967296.0 * hi + lo) / 10000 });
            });
        });
    }

    static void read_datetime8(parser &p, stream_reader::callback<column_value> cb)
    {
        p.read_int32_le([&p, cb=std::move(cb)](const int32_t days) {
            p.read_uint32_le([cb, days](const uint32_t ticks) {
                // 1/300 of a second rounded to milliseconds
                const int64_t ms = (int64_t { ticks } * 10 + 1) / 3;
                if (ms >= ms_per_day) [[unlikely]]
                    throw protocol_error(fmt::format("invalid datetime time of day: {}", ticks));
                cb(column_value { format_datetime(datetime_epoch_days + days, ms) });
            });
        });
    }

    static void read_datetime4(parser &p, stream_reader::callback<column_value> cb)
    {
        p.read_uint16_le([&p, cb=std::move(cb)](const uint16_t days) {
            p.read_uint16_le([cb, days](const uint16_t mins) {
                cb(column_value { format_datetime(datetime_epoch_days + days, int64_t { mins } * 60000) });
            });
        });
    }

    static void read_int64_exact(parser &p, stream_reader::callback<column_value> cb)
    {
        p.read_buffer(8, [cb=std::move(cb)](const buffer b) {
            cb(column_value { b.to<int64_t>() });
        });
    }

    static void read_fixed(parser &p, const type_info ti, const bool lower_case_guids, const uint8_t len, stream_reader::callback<column_value> cb)
    {
        const auto bad_length = [&] {
            return protocol_error(fmt::format("invalid length {} of a {} value", len, data_type_name(ti.type)));
        };
        switch (ti.type) {
            case data_type::null_type:
                cb(column_value {});
                break;
            case data_type::int1:
                p.read_uint8([cb](const uint8_t v) { cb(column_value { int64_t { v } }); });
                break;
            case data_type::bit:
                p.read_uint8([cb](const uint8_t v) { cb(column_value { v != 0 }); });
                break;
            case data_type::int2:
                p.read_int16_le([cb](const int16_t v) { cb(column_value { int64_t { v } }); });
                break;
            case data_type::int4:
                p.read_int32_le([cb](const int32_t v) { cb(column_value { int64_t { v } }); });
                break;
            case data_type::int8:
                read_int64_exact(p, std::move(cb));
                break;
            case data_type::flt4:
                p.read_float_le([cb](const float v) { cb(column_value { double { v } }); });
                break;
            case data_type::flt8:
                p.read_double_le([cb](const double v) { cb(column_value { v }); });
                break;
            case data_type::money4:
                p.read_int32_le([cb](const int32_t v) { cb(column_value { static_cast<double>(v) / 10000 }); });
                break;
            case data_type::money:
                read_money8(p, std::move(cb));
                break;
            case data_type::datetime:
                read_datetime8(p, std::move(cb));
                break;
            case data_type::datetim4:
                read_datetime4(p, std::move(cb));
                break;
            case data_type::intn:
                switch (len) {
                    case 1: return read_fixed(p, { data_type::int1 }, lower_case_guids, len, std::move(cb));
                    case 2: return read_fixed(p, { data_type::int2 }, lower_case_guids, len, std::move(cb));
                    case 4: return read_fixed(p, { data_type::int4 }, lower_case_guids, len, std::move(cb));
                    case 8: return read_fixed(p, { data_type::int8 }, lower_case_guids, len, std::move(cb));
                    default: throw bad_length();
                }
            case data_type::bitn:
                if (len != 1) [[unlikely]]
                    throw bad_length();
                read_fixed(p, { data_type::bit }, lower_case_guids, len, std::move(cb));
                break;
            case data_type::fltn:
                switch (len) {
                    case 4: return read_fixed(p, { data_type::flt4 }, lower_case_guids, len, std::move(cb));
                    case 8: return read_fixed(p, { data_type::flt8 }, lower_case_guids, len, std::move(cb));
                    default: throw bad_length();
                }
            case data_type::moneyn:
                switch (len) {
                    case 4: return read_fixed(p, { data_type::money4 }, lower_case_guids, len, std::move(cb));
                    case 8: return read_fixed(p, { data_type::money }, lower_case_guids, len, std::move(cb));
                    default: throw bad_length();
                }
            case data_type::datetimn:
                switch (len) {
                    case 4: return read_fixed(p, { data_type::datetim4 }, lower_case_guids, len, std::move(cb));
                    case 8: return read_fixed(p, { data_type::datetime }, lower_case_guids, len, std::move(cb));
                    default: throw bad_length();
                }
            case data_type::guid:
                if (len != 16) [[unlikely]]
                    throw bad_length();
                p.read_buffer(16, [cb, lower_case_guids](const buffer b) { cb(column_value { format_guid(b, lower_case_guids) }); });
                break;
            case data_type::decimaln:
            case data_type::numericn:
                read_decimal(p, ti, len, std::move(cb));
                break;
            case data_type::daten:
                if (len != 3) [[unlikely]]
                    throw bad_length();
                p.read_uint24_le([cb](const uint32_t days) { cb(column_value { format_date(date_epoch_days + days) }); });
                break;
            case data_type::timen:
                switch (len) {
                    case 3: p.read_uint24_le([cb, ti](const uint32_t v) { cb(column_value { format_time(v, ti.scale) }); }); break;
                    case 4: p.read_uint32_le([cb, ti](const uint32_t v) { cb(column_value { format_time(v, ti.scale) }); }); break;
                    case 5: p.read_uint40_le([cb, ti](const uint64_t v) { cb(column_value { format_time(v, ti.scale) }); }); break;
                    default: throw bad_length();
                }
                break;
            case data_type::datetime2n:
            case data_type::datetimeoffsetn: {
                const size_t date_len = ti.type == data_type::datetimeoffsetn ? 5 : 3;
                if (len <= date_len) [[unlikely]]
                    throw bad_length();
                const auto on_time = [&p, ti, cb](const uint64_t units) {
                    p.read_uint24_le([&p, ti, cb, units](const uint32_t date) {
                        const int64_t days = date_epoch_days + date;
                        if (ti.type == data_type::datetime2n) {
                            cb(column_value { fmt::format("{}T{}", format_date(days), format_time(units, ti.scale)) });
                            return;
                        }
                        p.read_int16_le([ti, cb, units, days](const int16_t offset_mins) {
                            cb(column_value { format_datetime_offset(days, units, ti.scale, offset_mins) });
                        });
                    });
                };
                switch (len - date_len) {
                    case 3: p.read_uint24_le([on_time](const uint32_t v) { on_time(v); }); break;
                    case 4: p.read_uint32_le([on_time](const uint32_t v) { on_time(v); }); break;
                    case 5: p.read_uint40_le(on_time); break;
                    default: throw bad_length();
                }
                break;
            }
            default:
                throw protocol_error(fmt::format("unsupported data type: {}", data_type_name(ti.type)));
        }
    }

    void read_value(parser &p, const column_metadata &meta, const parser_options &opts, stream_reader::callback<column_value> cb)
    {
        const auto ti = meta.type;
        const auto lower_case_guids = opts.lower_case_guids;
        switch (ti.type) {
            case data_type::null_type:
            case data_type::int1:
            case data_type::bit:
            case data_type::int2:
            case data_type::int4:
            case data_type::int8:
            case data_type::flt4:
            case data_type::flt8:
            case data_type::money:
            case data_type::money4:
            case data_type::datetime:
            case data_type::datetim4:
                read_fixed(p, ti, lower_case_guids, 0, std::move(cb));
                break;
            case data_type::intn:
            case data_type::bitn:
            case data_type::fltn:
            case data_type::moneyn:
            case data_type::datetimn:
            case data_type::guid:
            case data_type::decimaln:
            case data_type::numericn:
            case data_type::daten:
            case data_type::timen:
            case data_type::datetime2n:
            case data_type::datetimeoffsetn:
                // a zero length marks a NULL value
                p.read_uint8([&p, ti, lower_case_guids, cb=std::move(cb)](const uint8_t len) {
                    if (len == 0)
                        cb(column_value {});
                    else
                        read_fixed(p, ti, lower_case_guids, len, cb);
                });
                break;
            case data_type::bigvarbinary:
            case data_type::bigbinary:
            case data_type::bigvarchar:
            case data_type::bigchar:
            case data_type::nvarchar:
            case data_type::nchar:
                if (ti.plp()) {
                    read_plp(p, ti, std::move(cb));
                } else {
                    p.read_uint16_le([&p, ti, cb=std::move(cb)](const uint16_t len) {
                        if (len == charbin_null) {
                            cb(column_value {});
                            return;
                        }
                        p.read_buffer(len, [ti, cb](const buffer b) { cb(to_value(ti, b)); });
                    });
                }
                break;
            default:
                throw protocol_error(fmt::format("unsupported data type: 0x{:02X}", static_cast<uint8_t>(ti.type)));
        }
    }
}
