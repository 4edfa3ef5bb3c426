/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


//////////////
// includes //
//////////////
#include <cstdio>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "fmt/format.h"
#include "spdlog/spdlog.h"
#include <spdlog/sinks/stdout_color_sinks.h>

#include "morphemizer/Backend.hpp"
#include "morphemizer/Config.hpp"
#include "morphemizer/MorphemizerApi.hpp"
#include "morphemizer/Registry.hpp"
#include "morphemizer/morphemizer_api.h"


using std::cin;
using std::ifstream;
using std::string;
using std::vector;

using morphemizer::Config;
using morphemizer::Morpheme;
using morphemizer::Registry;


///////////////
// functions //
///////////////
int run(const cxxopts::ParseResult& opts) {
    auto _log = spdlog::get("console");
    if (morphemizer_set_log_levels(opts["set-log"].as<string>().c_str()) != 0) {
        _log->error(morphemizer_last_error());
        return 1;
    }

    Config cfg;
    try {
        if (opts.count("config")) cfg.read_from_file(opts["config"].as<string>());
        cfg.override_from_str(opts["opt-str"].as<string>().c_str());
    } catch (const morphemizer::Except& exc) {
        _log->error(exc.what());
        return 1;
    }

    Registry registry(cfg, morphemizer::create_japanese_analyzer(cfg),
                      morphemizer::create_chinese_segmenter(cfg));

    if (opts.count("list")) {
        for (const auto& mrp : registry.all()) {
            fmt::print("{}\t{}\n", mrp->name(), mrp->describe());
        }
        return 0;
    }

    string name = opts["morphemizer"].as<string>();
    auto found = registry.by_name(name);
    if (!found) {
        _log->error("morphemizer not found: {}", name);
        return 1;
    }
    const morphemizer::Morphemizer& target = *found;

    for (string line; getline(cin, line); ) {
        _log->debug("expr: {}", line);
        vector<Morpheme> morphs;
        try {
            morphs = target.segment(line);
        } catch (const morphemizer::ServiceExcept& exc) {
            _log->warn("{}: {}", exc.what(), line);
            continue;
        }
        fmt::print("{}\t", line);
        for (size_t i = 0; i < morphs.size(); ++i) {
            if (i > 0) fmt::print(" + ");
            fmt::print("{}/{}", morphs[i].base, morphs[i].pos);
        }
        fmt::print("\n");
    }

    return 0;
}


//////////
// main //
//////////
int main(int argc, char** argv) {
    auto _log = spdlog::stderr_color_mt("console");
    spdlog::set_level(spdlog::level::warn);

    cxxopts::Options options("morphemizer", "split expressions into morphemes");
    options.add_options()
        ("h,help", "print this help")
        ("config", "preference file (JSON format)", cxxopts::value<string>())
        ("opt-str", "preference override (JSON format)",
         cxxopts::value<string>()->default_value(""))
        ("morphemizer", "morphemizer name",
         cxxopts::value<string>()->default_value("SpaceMorphemizer"))
        ("list", "list morphemizers with their descriptions")
        ("input", "input file (default: stdin)", cxxopts::value<string>())
        ("output", "output file (default: stdout)", cxxopts::value<string>())
        ("set-log", "set log level", cxxopts::value<string>()->default_value("all:info"));
    auto opts = options.parse(argc, argv);

    if (opts.count("help")) {
        fmt::print(stderr, "{}\n", options.help());
        return 0;
    }
    if (opts.count("input")) {
        string path = opts["input"].as<string>();
        ifstream fin(path);
        if (!fin.good()) {
            _log->error("input file not found: {}", path);
            return 1;
        }
        if (freopen(path.c_str(), "r", stdin) == nullptr) {
            _log->error("fail to open input file: {}", path);
            return 2;
        }
    }
    if (opts.count("output")) {
        string path = opts["output"].as<string>();
        if (freopen(path.c_str(), "w", stdout) == nullptr) {
            _log->error("fail to open output file: {}", path);
            return 3;
        }
    }

    return run(opts);
}
