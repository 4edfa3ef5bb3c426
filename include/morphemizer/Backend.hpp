/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_BACKEND_HPP_
#define INCLUDE_MORPHEMIZER_BACKEND_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "morphemizer/Morpheme.hpp"


namespace morphemizer {


class Config;


/**
 * external Japanese morphological analyzer
 */
class JapaneseAnalyzer {
 public:
    virtual ~JapaneseAnalyzer() = default;    ///< dtor

    /**
     * analyze unsegmented Japanese text
     * @param  text  input text (UTF-8)
     * @return  morphemes. throws ServiceExcept if the analyzer fails
     */
    virtual std::vector<Morpheme> analyze(const std::string& text) = 0;

    /**
     * version/build string of the analyzer
     * @return  identity. throws if the analyzer is not reachable
     */
    virtual std::string identity() = 0;
};


/**
 * external Chinese part-of-speech segmenter
 */
class ChineseSegmenter {
 public:
    using tagged_word_t = std::pair<std::string, std::string>;    ///< (word, flag)

    virtual ~ChineseSegmenter() = default;    ///< dtor

    /**
     * cut text into words with part-of-speech flags
     * @param  text  input text (UTF-8)
     * @return  (word, flag) pairs. throws ServiceExcept if the segmenter fails
     */
    virtual std::vector<tagged_word_t> cut(const std::string& text) = 0;
};


/**
 * create the analyzer this library was built with (MeCab)
 * @param  cfg  preferences ("mecab_args")
 * @return  analyzer
 */
std::shared_ptr<JapaneseAnalyzer> create_japanese_analyzer(const Config& cfg);


/**
 * create the segmenter this library was built with (cppjieba)
 * @param  cfg  preferences ("jieba_dict_dir")
 * @return  segmenter
 */
std::shared_ptr<ChineseSegmenter> create_chinese_segmenter(const Config& cfg);


}    // namespace morphemizer


#endif    // INCLUDE_MORPHEMIZER_BACKEND_HPP_
