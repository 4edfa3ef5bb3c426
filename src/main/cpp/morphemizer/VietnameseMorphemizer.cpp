/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/VietnameseMorphemizer.hpp"

/** Supports spdlog::stderr_color_mt */
#include <spdlog/sinks/stdout_color_sinks.h>


//////////////
// includes //
//////////////
#include <algorithm>

#include "morphemizer/SpaceMorphemizer.hpp"
#include "morphemizer/util.hpp"


namespace morphemizer {


using std::shared_ptr;
using std::string;
using std::vector;


////////////////////
// static members //
////////////////////
const char* const VietnameseMorphemizer::NAME = "VietnameseMorphemizer";

shared_ptr<spdlog::logger> VietnameseMorphemizer::_log =
    spdlog::stderr_color_mt("VietnameseMorphemizer");


////////////////////
// ctors and dtor //
////////////////////
VietnameseMorphemizer::VietnameseMorphemizer(const string& freq_path, size_t cache_capacity)
        : Morphemizer(cache_capacity) {
    if (freq_path.empty()) {
        _log->info("no frequency list configured, compound words are not recognized");
        return;
    }
    try {
        _compounds.open(freq_path);
    } catch (const Except& exc) {
        _log->warn("compound words are not recognized: {}", exc.what());
        _compounds.close();
    }
}


/////////////
// methods //
/////////////
string VietnameseMorphemizer::describe() const {
    return "Vietnamese";
}


const char* VietnameseMorphemizer::name() const {
    return NAME;
}


vector<Morpheme> VietnameseMorphemizer::_segment(const string& expr) const {
    if (_compounds.size() == 0) return SpaceMorphemizer::split_words(expr);

    string text = to_lower(expr);
    // each substitution sees the result of the previous (longer) ones
    const auto& words = _compounds.words();
    const auto& joined = _compounds.joined();
    for (size_t i = 0; i < words.size(); ++i) {
        replace_all(&text, words[i], joined[i]);
    }

    auto morphs = SpaceMorphemizer::split_words(text);
    for (auto& morph : morphs) {
        std::replace(morph.base.begin(), morph.base.end(), CompoundDict::JOINER, ' ');
    }
    return morphs;
}


}    // namespace morphemizer
