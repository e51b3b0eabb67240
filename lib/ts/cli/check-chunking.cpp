/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <random>
#include <ts/cli.hpp>
#include <ts/token-parser.hpp>

namespace tds_stream::cli::check_chunking {
    using token_list = std::vector<token>;

    static token_list decode(const buffer data, const parser_options &popts, const std::function<size_t()> &next_size)
    {
        token_list tokens {};
        parser p { [&](token &&t) { tokens.emplace_back(std::move(t)); }, popts };
        for (size_t off = 0; off < data.size(); ) {
            const auto sz = std::min(next_size(), data.size() - off);
            p.write(data.subbuf(off, sz));
            off += sz;
        }
        if (p.suspended()) [[unlikely]]
            throw error(fmt::format("the capture ends inside a token: the pending read needs {} bytes", p.needed()));
        return tokens;
    }

    static void compare(const token_list &exp, const token_list &act, const std::string_view partition)
    {
        if (exp.size() != act.size()) [[unlikely]]
            throw error(fmt::format("{}: expected {} tokens but got {}", partition, exp.size(), act.size()));
        for (size_t i = 0; i < exp.size(); ++i) {
            if (exp[i] != act[i]) [[unlikely]]
                throw error(fmt::format("{}: token #{} differs: expected {} but got {}", partition, i, exp[i], act[i]));
        }
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "check-chunking";
            cmd.desc = "verify that every partitioning of a captured stream yields the same tokens";
            cmd.args.expect({ "<capture>" });
            cmd.opts.try_emplace("max-chunk-size", "the largest fixed chunk size to try", "64", positive_int_validator);
            cmd.opts.try_emplace("random-iterations", "the number of random partitions to try", "16", positive_int_validator);
            capture::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto bytes = capture::load(args.at(0), opts);
            const auto popts = capture::load_options(opts);
            const buffer data { bytes };
            const auto exp = decode(data, popts, [&] { return std::max(data.size(), size_t { 1 }); });
            logger::info("the reference decoding has {} tokens", exp.size());
            const auto max_chunk_size = std::min(capture::size_opt(opts, "max-chunk-size"), std::max(data.size(), size_t { 1 }));
            for (size_t chunk_size = 1; chunk_size <= max_chunk_size; ++chunk_size) {
                compare(exp, decode(data, popts, [&] { return chunk_size; }), fmt::format("chunk size {}", chunk_size));
                logger::debug("chunk size {}: OK", chunk_size);
            }
            const auto num_iters = capture::size_opt(opts, "random-iterations");
            std::mt19937 rnd { 42 };
            for (size_t iter = 0; iter < num_iters; ++iter) {
                // zero-sized chunks are allowed and must be harmless
                std::uniform_int_distribution<size_t> dist { 0, max_chunk_size };
                compare(exp, decode(data, popts, [&] { return dist(rnd); }), fmt::format("random partition #{}", iter));
            }
            logger::info("all {} fixed and {} random partitions produced the same {} tokens", max_chunk_size, num_iters, exp.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
