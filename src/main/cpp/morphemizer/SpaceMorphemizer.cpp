/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/SpaceMorphemizer.hpp"


//////////////
// includes //
//////////////
#include "morphemizer/util.hpp"


namespace morphemizer {


using std::string;
using std::u32string;
using std::vector;


////////////////////
// static members //
////////////////////
const char* const SpaceMorphemizer::NAME = "SpaceMorphemizer";


////////////////////
// ctors and dtor //
////////////////////
SpaceMorphemizer::SpaceMorphemizer(size_t cache_capacity): Morphemizer(cache_capacity) {}


///////////////
// functions //
///////////////
namespace {

/**
 * word boundary: word character on one side and non-word character (or the end) on the other
 * @param  wexpr  expression
 * @param  pos  position between (pos - 1) and pos
 * @return  true if boundary
 */
bool _is_boundary(const u32string& wexpr, size_t pos) {
    bool left = pos > 0 && is_word_char(wexpr[pos - 1]);
    bool right = pos < wexpr.length() && is_word_char(wexpr[pos]);
    return left != right;
}

inline bool _is_token_char(char32_t chr) {
    return !is_space(chr) && !is_digit(chr);
}

}    // namespace


/////////////
// methods //
/////////////
string SpaceMorphemizer::describe() const {
    return "Language w/ Spaces";
}


const char* SpaceMorphemizer::name() const {
    return NAME;
}


vector<Morpheme> SpaceMorphemizer::split_words(const string& expr) {
    u32string wexpr = utf8_to_wstr(expr);
    vector<Morpheme> morphs;
    size_t begin = 0;
    while (begin < wexpr.length()) {
        if (!_is_token_char(wexpr[begin]) || !_is_boundary(wexpr, begin)) {
            ++begin;
            continue;
        }
        size_t run_end = begin + 1;
        while (run_end < wexpr.length() && _is_token_char(wexpr[run_end])) ++run_end;
        // backtrack to the last boundary inside the run
        size_t end = run_end;
        while (end > begin && !_is_boundary(wexpr, end)) --end;
        if (end == begin) {
            ++begin;
            continue;
        }
        string word = to_lower(wstr_to_utf8(wexpr.substr(begin, end - begin)));
        morphs.emplace_back(Morpheme::of_token(word, UNKNOWN_TAG));
        begin = end;
    }
    return morphs;
}


vector<Morpheme> SpaceMorphemizer::_segment(const string& expr) const {
    return split_words(expr);
}


}    // namespace morphemizer
