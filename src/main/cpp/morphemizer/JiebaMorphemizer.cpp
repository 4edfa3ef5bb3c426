/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/JiebaMorphemizer.hpp"


//////////////
// includes //
//////////////
#include <exception>
#include <utility>

#include "fmt/format.h"

#include "morphemizer/Cjk.hpp"


namespace morphemizer {


using std::exception;
using std::shared_ptr;
using std::string;
using std::vector;


////////////////////
// static members //
////////////////////
const char* const JiebaMorphemizer::NAME = "JiebaMorphemizer";


////////////////////
// ctors and dtor //
////////////////////
JiebaMorphemizer::JiebaMorphemizer(shared_ptr<ChineseSegmenter> segmenter, size_t cache_capacity)
        : Morphemizer(cache_capacity), _segmenter(std::move(segmenter)) {
    if (!_segmenter) throw Except("Chinese segmenter is null");
}


/////////////
// methods //
/////////////
string JiebaMorphemizer::describe() const {
    return "Chinese";
}


const char* JiebaMorphemizer::name() const {
    return NAME;
}


vector<Morpheme> JiebaMorphemizer::_segment(const string& expr) const {
    // punctuations, latin letters and spaces confuse the segmenter
    string text = filter_cjk(expr);
    if (text.empty()) return {};

    vector<ChineseSegmenter::tagged_word_t> words;
    try {
        words = _segmenter->cut(text);
    } catch (const ServiceExcept&) {
        throw;
    } catch (const exception& exc) {
        throw ServiceExcept(fmt::format("Chinese segmenter failed: {}", exc.what()));
    }

    vector<Morpheme> morphs;
    for (const auto& word : words) {
        morphs.emplace_back(Morpheme::of_token(word.first, word.second));
    }
    return morphs;
}


}    // namespace morphemizer
