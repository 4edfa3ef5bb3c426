/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2017-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/morphemizer_api.h"


//////////////
// includes //
//////////////
#include <map>
#include <mutex>    // NOLINT
#include <string>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "morphemizer/MorphemizerApi.hpp"
#include "morphemizer/util.hpp"


using std::map;
using std::mutex;
using std::string;
using std::unique_lock;
using morphemizer::Except;


///////////////
// variables //
///////////////
namespace {

mutex ERR_MUTEX;    // NOLINT
string LAST_ERROR;    // NOLINT


void _set_err_msg(const string& msg) {
    unique_lock<mutex> lock(ERR_MUTEX);
    LAST_ERROR = msg;
}


void _set_log_level(const string& name, const string& level) {
    static const map<string, spdlog::level::level_enum> LEVELS = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
    };

    auto found = LEVELS.find(level);
    if (found == LEVELS.end()) throw Except(fmt::format("invalid log level: {}", level));

    if (name == "all") {
        spdlog::set_level(found->second);
    } else {
        auto logger = spdlog::get(name);
        if (!logger) throw Except(fmt::format("invalid logger name: {}", name));
        logger->set_level(found->second);
    }
}

}    // namespace


///////////////
// functions //
///////////////
const char* morphemizer_version() {
    return MORPHEMIZER_VERSION;
}


int morphemizer_set_log_level(const char* name, const char* level) {
    if (name == nullptr || level == nullptr || !name[0] || !level[0]) {
        _set_err_msg("log name or level is null");
        return -1;
    }

    try {
        _set_log_level(name, level);
    } catch (const Except& exc) {
        _set_err_msg(exc.what());
        return -1;
    }
    return 0;
}


int morphemizer_set_log_levels(const char* name_level_pairs) {
    if (name_level_pairs == nullptr) {
        _set_err_msg("log name/level pair is null");
        return -1;
    }

    try {
        for (const auto& name_level_pair : morphemizer::split(name_level_pairs, ',')) {
            auto name_level = morphemizer::split(name_level_pair.c_str(), ':');
            if (name_level.size() != 2) {
                throw Except(fmt::format("invalid logger name/level pair: {}", name_level_pair));
            }
            _set_log_level(name_level[0], name_level[1]);
        }
    } catch (const Except& exc) {
        _set_err_msg(exc.what());
        return -1;
    }
    return 0;
}


const char* morphemizer_last_error() {
    unique_lock<mutex> lock(ERR_MUTEX);
    return LAST_ERROR.c_str();
}
