/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <iostream>
#include <ts/cli.hpp>
#include <ts/file.hpp>

namespace tds_stream::cli {
    namespace capture {
        void add_opts(config &cmd)
        {
            cmd.opts.try_emplace("hex", "the capture is hex text instead of raw bytes");
            cmd.opts.try_emplace("config", "a JSON file with the parser options");
        }

        uint8_vector load(const std::string &path, const options &opts)
        {
            auto bytes = file::read_capture(path, opts.contains("hex"));
            logger::info("loaded {} bytes from {}", bytes.size(), path);
            return bytes;
        }

        parser_options load_options(const options &opts)
        {
            const auto it = opts.find("config");
            if (it == opts.end())
                return {};
            if (!it->second) [[unlikely]]
                throw error("--config requires a path");
            const auto popts = parser_options::from_config(config_file { *it->second });
            logger::info("parser options: TDS {} camelCaseColumns: {} lowerCaseGuids: {} maxFieldSize: {}",
                popts.version, popts.camel_case_columns, popts.lower_case_guids, popts.max_field_size);
            return popts;
        }

        size_t size_opt(const options &opts, const std::string &name)
        {
            const auto it = opts.find(name);
            if (it == opts.end() || !it->second) [[unlikely]]
                throw error(fmt::format("option --{} is missing a value", name));
            size_t num = 0;
            const auto &val = *it->second;
            if (const auto res = std::from_chars(val.data(), val.data() + val.size(), num); res.ec != std::errc {}) [[unlikely]]
                throw error(fmt::format("option --{} is not an integer: {}", name, val));
            return num;
        }
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { *cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n" ;
            for (const auto &[name, cmd]: commands)
                std::cerr << fmt::format("    {} {}\n", cmd.cfg.name, cmd.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        const auto ex = logger::run_log_errors([&] {
            const auto &meta = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::info };
            const auto pr = meta.cmd.parse(meta.cfg, args);
            meta.cmd.run(pr.args, pr.opts);
        });
        return ex ? 1 : 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
