/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_METADATA_HPP
#define TDS_STREAM_METADATA_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <ts/common/bytes.hpp>

namespace tds_stream {
    enum class data_type: uint8_t {
        null_type = 0x1F,
        guid = 0x24,
        intn = 0x26,
        daten = 0x28,
        timen = 0x29,
        datetime2n = 0x2A,
        datetimeoffsetn = 0x2B,
        int1 = 0x30,
        bit = 0x32,
        int2 = 0x34,
        int4 = 0x38,
        datetim4 = 0x3A,
        flt4 = 0x3B,
        money = 0x3C,
        datetime = 0x3D,
        flt8 = 0x3E,
        bitn = 0x68,
        decimaln = 0x6A,
        numericn = 0x6C,
        fltn = 0x6D,
        moneyn = 0x6E,
        datetimn = 0x6F,
        money4 = 0x7A,
        int8 = 0x7F,
        bigvarbinary = 0xA5,
        bigvarchar = 0xA7,
        bigbinary = 0xAD,
        bigchar = 0xAF,
        nvarchar = 0xE7,
        nchar = 0xEF
    };

    extern const char *data_type_name(data_type type);

    struct collation {
        // LCID in the low 20 bits followed by the comparison flags and the version
        uint32_t info = 0;
        uint8_t sort_id = 0;

        uint32_t lcid() const noexcept
        {
            return info & 0xFFFFF;
        }

        bool operator==(const collation &) const =default;
    };

    struct type_info {
        // the length that marks the partially length-prefixed (max) encoding
        static constexpr uint32_t plp_length = 0xFFFF;

        data_type type = data_type::null_type;
        uint32_t data_length = 0;
        uint8_t precision = 0;
        uint8_t scale = 0;
        std::optional<collation> coll {};

        bool plp() const noexcept
        {
            return data_length == plp_length;
        }

        bool operator==(const type_info &) const =default;
    };

    struct column_metadata {
        static constexpr uint16_t flag_nullable = 0x0001;
        static constexpr uint16_t flag_identity = 0x0010;
        static constexpr uint16_t flag_computed = 0x0020;

        uint32_t user_type = 0;
        uint16_t flags = 0;
        type_info type {};
        std::string name {};

        bool nullable() const noexcept
        {
            return flags & flag_nullable;
        }

        bool operator==(const column_metadata &) const =default;
    };

    using column_list = std::vector<column_metadata>;

    using column_value = std::variant<std::monostate, bool, int64_t, double, std::string, uint8_vector>;
}

namespace fmt {
    template<>
    struct formatter<tds_stream::column_value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return std::visit([&](const auto &vv) {
                using T = std::decay_t<decltype(vv)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return fmt::format_to(ctx.out(), "NULL");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(ctx.out(), "'{}'", vv);
                } else if constexpr (std::is_same_v<T, tds_stream::uint8_vector>) {
                    return fmt::format_to(ctx.out(), "0x{}", vv);
                } else {
                    return fmt::format_to(ctx.out(), "{}", vv);
                }
            }, v);
        }
    };

    template<>
    struct formatter<tds_stream::column_metadata>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}:{}({})", v.name, tds_stream::data_type_name(v.type.type), v.type.data_length);
        }
    };
}

#endif // !TDS_STREAM_METADATA_HPP
