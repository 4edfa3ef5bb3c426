/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/CjkCharMorphemizer.hpp"


//////////////
// includes //
//////////////
#include "morphemizer/Cjk.hpp"


namespace morphemizer {


using std::string;
using std::vector;


////////////////////
// static members //
////////////////////
const char* const CjkCharMorphemizer::NAME = "CjkCharMorphemizer";


////////////////////
// ctors and dtor //
////////////////////
CjkCharMorphemizer::CjkCharMorphemizer(size_t cache_capacity): Morphemizer(cache_capacity) {}


/////////////
// methods //
/////////////
string CjkCharMorphemizer::describe() const {
    return "CJK Characters";
}


const char* CjkCharMorphemizer::name() const {
    return NAME;
}


vector<Morpheme> CjkCharMorphemizer::_segment(const string& expr) const {
    vector<Morpheme> morphs;
    for (const auto& chr : cjk_chars(expr)) {
        morphs.emplace_back(Morpheme::of_token(chr, CJK_CHAR_TAG));
    }
    return morphs;
}


}    // namespace morphemizer
