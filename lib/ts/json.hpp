/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TDS_STREAM_JSON_HPP
#define TDS_STREAM_JSON_HPP

#include <boost/json.hpp>
#include <ts/file.hpp>

namespace tds_stream::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline const json::object &as_object(const json::value &v, const std::string_view what)
    {
        if (!v.is_object()) [[unlikely]]
            throw error(fmt::format("{} must be a JSON object", what));
        return v.get_object();
    }
}

#endif // !TDS_STREAM_JSON_HPP
