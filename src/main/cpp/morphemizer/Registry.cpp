/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/Registry.hpp"

/** Supports spdlog::stderr_color_mt */
#include <spdlog/sinks/stdout_color_sinks.h>


//////////////
// includes //
//////////////
#include <utility>

#include "morphemizer/CjkCharMorphemizer.hpp"
#include "morphemizer/Config.hpp"
#include "morphemizer/JiebaMorphemizer.hpp"
#include "morphemizer/MecabMorphemizer.hpp"
#include "morphemizer/SpaceMorphemizer.hpp"
#include "morphemizer/VietnameseMorphemizer.hpp"


namespace morphemizer {


using std::make_shared;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_lock;
using std::vector;


////////////////////
// static members //
////////////////////
shared_ptr<spdlog::logger> Registry::_log = spdlog::stderr_color_mt("Registry");


////////////////////
// ctors and dtor //
////////////////////
Registry::Registry(const Config& cfg, shared_ptr<JapaneseAnalyzer> analyzer,
                   shared_ptr<ChineseSegmenter> segmenter)
        : _cfg(cfg), _analyzer(std::move(analyzer)), _segmenter(std::move(segmenter)) {}


/////////////
// methods //
/////////////
const vector<shared_ptr<Morphemizer>>& Registry::all() {
    unique_lock<mutex> lock(_mutex);
    if (!_is_built) _build();
    return _morphemizers;
}


boost::optional<Morphemizer&> Registry::by_name(const string& name) {
    unique_lock<mutex> lock(_mutex);
    if (!_is_built) _build();
    auto found = _by_name.find(name);
    if (found == _by_name.end()) return boost::none;
    return *found->second;
}


void Registry::_build() {
    size_t capacity = _cfg.cache_capacity;
    _morphemizers = {
        make_shared<SpaceMorphemizer>(capacity),
        make_shared<MecabMorphemizer>(_analyzer, capacity),
        make_shared<JiebaMorphemizer>(_segmenter, capacity),
        make_shared<CjkCharMorphemizer>(capacity),
        make_shared<VietnameseMorphemizer>(_cfg.get_preference("path_frequency"), capacity),
    };
    for (const auto& morphemizer : _morphemizers) {
        _by_name[morphemizer->name()] = morphemizer;
        _log->debug("registered: {}", morphemizer->name());
    }
    _is_built = true;
    _log->info("{} morphemizers registered", _morphemizers.size());
}


}    // namespace morphemizer
