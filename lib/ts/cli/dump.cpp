/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ts/cli.hpp>
#include <ts/token-parser.hpp>

namespace tds_stream::cli::dump {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "dump";
            cmd.desc = "decode a captured token stream and log every token";
            cmd.args.expect({ "<capture>" });
            cmd.opts.try_emplace("chunk-size", "feed the parser in chunks of this many bytes; the whole capture at once if not given", std::optional<std::string> {}, positive_int_validator);
            capture::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto bytes = capture::load(args.at(0), opts);
            const auto popts = capture::load_options(opts);
            const auto chunk_size = opts.contains("chunk-size") ? capture::size_opt(opts, "chunk-size") : std::max(bytes.size(), size_t { 1 });
            size_t num_tokens = 0;
            parser p { [&](token &&t) {
                logger::info("#{} {}", num_tokens++, describe(t));
            }, popts };
            const buffer data { bytes };
            for (size_t off = 0; off < data.size(); off += chunk_size)
                p.write(data.subbuf(off, std::min(chunk_size, data.size() - off)));
            if (p.suspended())
                logger::warn("the capture ends inside a token: {} bytes buffered, the pending read needs {}", p.buffered(), p.needed());
            p.end_of_message();
            logger::info("decoded {} tokens from {} bytes in chunks of {} bytes", num_tokens, bytes.size(), chunk_size);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
