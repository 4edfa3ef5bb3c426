/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/Backend.hpp"


//////////////
// includes //
//////////////
#include "morphemizer/Config.hpp"
#include "morphemizer/MorphemizerApi.hpp"
#ifdef MORPHEMIZER_HAVE_MECAB
    #include "morphemizer/MecabAnalyzer.hpp"
#endif
#ifdef MORPHEMIZER_HAVE_CPPJIEBA
    #include "morphemizer/JiebaSegmenter.hpp"
#endif


namespace morphemizer {


using std::make_shared;
using std::shared_ptr;
using std::string;
using std::vector;


namespace {

/**
 * stands for an analyzer this library was built without. every call fails
 */
class UnavailableAnalyzer: public JapaneseAnalyzer {
 public:
    vector<Morpheme> analyze(const string& text) override {
        throw ServiceExcept("MeCab is not available");
    }

    string identity() override {
        throw ServiceExcept("MeCab is not available");
    }
};


class UnavailableSegmenter: public ChineseSegmenter {
 public:
    vector<tagged_word_t> cut(const string& text) override {
        throw ServiceExcept("cppjieba is not available");
    }
};

}    // namespace


///////////////
// functions //
///////////////
shared_ptr<JapaneseAnalyzer> create_japanese_analyzer(const Config& cfg) {
#ifdef MORPHEMIZER_HAVE_MECAB
    return make_shared<MecabAnalyzer>(cfg.get_preference("mecab_args"));
#else
    return make_shared<UnavailableAnalyzer>();
#endif
}


shared_ptr<ChineseSegmenter> create_chinese_segmenter(const Config& cfg) {
#ifdef MORPHEMIZER_HAVE_CPPJIEBA
    return make_shared<JiebaSegmenter>(cfg.get_preference("jieba_dict_dir"));
#else
    return make_shared<UnavailableSegmenter>();
#endif
}


}    // namespace morphemizer
