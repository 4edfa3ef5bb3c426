/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2017-, Kakao Corp. All rights reserved.
 */


//////////////
// includes //
//////////////
#include <iostream>

#include "cxxopts.hpp"
#include "fmt/format.h"
#include "gtest/gtest.h"
#include "spdlog/spdlog.h"
#include <spdlog/sinks/stdout_color_sinks.h>

#include "morphemizer/morphemizer_api.h"

using std::string;


///////////////
// variables //
///////////////
// global variable for program arguments
cxxopts::ParseResult* prog_args;


//////////
// main //
//////////
int main(int argc, char** argv) {
    cxxopts::Options options(argv[0], argv[0]);
    testing::InitGoogleTest(&argc, argv);
    auto _log = spdlog::stderr_color_mt("console");
    spdlog::set_level(spdlog::level::warn);

    options.add_options()
        ("h,help", "print this help")
        ("tmp-dir", "directory for temporary files", cxxopts::value<string>()->default_value("/tmp"))
        ("jieba-dict-dir", "cppjieba dictionary directory",
         cxxopts::value<string>()->default_value(""))
        ("set-log", "set log level", cxxopts::value<string>()->default_value("all:warn"));
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
        fmt::print(stderr, "{}\n", options.help());
        return 0;
    }
    prog_args = &args;
    if (morphemizer_set_log_levels(args["set-log"].as<string>().c_str()) != 0) {
        _log->error(morphemizer_last_error());
        return 1;
    }

    return RUN_ALL_TESTS();
}
