/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/MorphemizerApi.hpp"


//////////////
// includes //
//////////////
#include <memory>
#include <sstream>


namespace morphemizer {


using std::make_shared;
using std::ostringstream;
using std::string;
using std::vector;


////////////////////
// static members //
////////////////////
const size_t Morphemizer::DEFAULT_CACHE_CAPACITY;


////////////////////
// ctors and dtor //
////////////////////
Morphemizer::Morphemizer(size_t cache_capacity): _cache(cache_capacity) {}


Except::Except(string msg, const char* file, const int line, const char* func)
        : _msg(msg), _file(file), _line(line), _func(func) {}


/////////////
// methods //
/////////////
vector<Morpheme> Morphemizer::segment(const string& expr) const {
    auto cached = _cache.get(expr);
    if (cached) return **cached;

    auto morphs = make_shared<const vector<Morpheme>>(_segment(expr));
    _cache.put(expr, morphs);
    return *morphs;
}


string Morphemizer::describe() const {
    return "No information available";
}


vector<Morpheme> Morphemizer::_segment(const string& expr) const {
    return {};
}


const char* Except::what() const noexcept {
    return _msg.c_str();
}


string Except::debug() const {
    ostringstream oss;
    if (_func != nullptr) oss << _func;
    if (_file != nullptr) {
        oss <<  "(" << _file;
        if (_line > 0) oss << ":" << _line;
        oss << ")";
    }
    if (oss.str().length() > 0) oss << " ";
    oss << _msg;
    return oss.str();
}


}    // namespace morphemizer
