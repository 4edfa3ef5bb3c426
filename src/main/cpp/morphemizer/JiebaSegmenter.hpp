/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_JIEBASEGMENTER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_JIEBASEGMENTER_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <mutex>    // NOLINT
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "morphemizer/Backend.hpp"


namespace cppjieba {
class Jieba;
}


namespace morphemizer {


/**
 * Chinese part-of-speech segmenter backed by cppjieba.
 * dictionaries are loaded on first cut.
 */
class JiebaSegmenter: public ChineseSegmenter {
 public:
    /**
     * @param  dict_dir  directory of jieba.dict.utf8, hmm_model.utf8, user.dict.utf8,
     *                   idf.utf8 and stop_words.utf8
     */
    explicit JiebaSegmenter(std::string dict_dir);

    virtual ~JiebaSegmenter();    ///< dtor

    std::vector<tagged_word_t> cut(const std::string& text) override;

 private:
    static std::shared_ptr<spdlog::logger> _log;    ///< logger

    std::string _dict_dir;    ///< dictionary directory
    std::mutex _mutex;    ///< mutex to load exclusively
    std::unique_ptr<cppjieba::Jieba> _jieba;

    const cppjieba::Jieba& _get_jieba();    ///< load dictionaries if not yet
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_JIEBASEGMENTER_HPP_
