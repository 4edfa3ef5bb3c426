/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/MecabMorphemizer.hpp"

/** Supports spdlog::stderr_color_mt */
#include <spdlog/sinks/stdout_color_sinks.h>


//////////////
// includes //
//////////////
#include <algorithm>
#include <exception>
#include <utility>

#include "fmt/format.h"


namespace morphemizer {


using std::exception;
using std::shared_ptr;
using std::string;
using std::vector;


////////////////////
// static members //
////////////////////
const char* const MecabMorphemizer::NAME = "MecabMorphemizer";

shared_ptr<spdlog::logger> MecabMorphemizer::_log = spdlog::stderr_color_mt("MecabMorphemizer");


////////////////////
// ctors and dtor //
////////////////////
MecabMorphemizer::MecabMorphemizer(shared_ptr<JapaneseAnalyzer> analyzer, size_t cache_capacity)
        : Morphemizer(cache_capacity), _analyzer(std::move(analyzer)) {
    if (!_analyzer) throw Except("Japanese analyzer is null");
}


/////////////
// methods //
/////////////
string MecabMorphemizer::describe() const {
    string identity;
    try {
        identity = _analyzer->identity();
    } catch (const exception& exc) {
        _log->debug("fail to get analyzer identity: {}", exc.what());
        identity = "UNAVAILABLE";
    } catch (...) {
        _log->debug("fail to get analyzer identity: unknown error");
        identity = "UNAVAILABLE";
    }
    return "Japanese " + identity;
}


const char* MecabMorphemizer::name() const {
    return NAME;
}


vector<Morpheme> MecabMorphemizer::_segment(const string& expr) const {
    // spaces added by other tools break the analysis
    string text(expr);
    text.erase(std::remove(text.begin(), text.end(), ' '), text.end());

    try {
        return _analyzer->analyze(text);
    } catch (const ServiceExcept&) {
        throw;
    } catch (const exception& exc) {
        throw ServiceExcept(fmt::format("Japanese analyzer failed: {}", exc.what()));
    }
}


}    // namespace morphemizer
