/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/Config.hpp"


//////////////
// includes //
//////////////
#include <cstdint>
#include <exception>
#include <fstream>

#include "fmt/format.h"
#include "nlohmann/json.hpp"

#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


using std::exception;
using std::ifstream;
using std::string;


////////////////////
// ctors and dtor //
////////////////////
Config::Config(): cache_capacity(Morphemizer::DEFAULT_CACHE_CAPACITY),
                  _prefs(nlohmann::json::object()) {}


/////////////
// methods //
/////////////
void Config::read_from_file(const string& path) {
    ifstream ifs(path);
    if (!ifs.good()) throw Except(fmt::format("config file not found: {}", path));
    try {
        nlohmann::json jsn;
        ifs >> jsn;
        _merge(jsn);
    } catch (const exception& exc) {
        throw Except(fmt::format("fail to parse config: {}", exc.what()));
    }
}


void Config::override_from_str(const char* opt_str) {
    if (opt_str == nullptr || opt_str[0] == '\0') return;

    try {
        auto jsn = nlohmann::json::parse(opt_str);
        _merge(jsn);
    } catch (const exception& exc) {
        throw Except(fmt::format("fail to parse option: {}\n{}", exc.what(), opt_str));
    }
}


string Config::get_preference(const string& key) const {
    auto found = _prefs.find(key);
    if (found == _prefs.end() || !found->is_string()) return "";
    return found->get<string>();
}


void Config::_merge(const nlohmann::json& jsn) {
    if (!jsn.is_object()) throw Except("preferences must be a JSON object");

    auto capacity = jsn.value("cache_capacity", static_cast<int64_t>(cache_capacity));
    if (capacity <= 0) throw Except(fmt::format("invalid 'cache_capacity' value: {}", capacity));

    _prefs.update(jsn);
    cache_capacity = static_cast<size_t>(capacity);
}


}    // namespace morphemizer
