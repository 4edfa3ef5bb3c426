/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_MECABANALYZER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_MECABANALYZER_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <mutex>    // NOLINT
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "morphemizer/Backend.hpp"


namespace MeCab {
class Tagger;
}


namespace morphemizer {


/**
 * Japanese analyzer backed by MeCab (libmecab).
 * the tagger is created on first use, so a missing dictionary is reported as ServiceExcept.
 */
class MecabAnalyzer: public JapaneseAnalyzer {
 public:
    /**
     * @param  args  tagger arguments (ex: "-d /usr/lib/mecab/dic/ipadic")
     */
    explicit MecabAnalyzer(std::string args = "");

    virtual ~MecabAnalyzer();    ///< dtor

    std::vector<Morpheme> analyze(const std::string& text) override;

    std::string identity() override;

 private:
    static std::shared_ptr<spdlog::logger> _log;    ///< logger

    std::string _args;    ///< tagger arguments
    std::mutex _mutex;    ///< tagger is not thread-safe
    std::unique_ptr<MeCab::Tagger> _tagger;

    MeCab::Tagger& _get_tagger();    ///< create tagger if not yet (mutex is held)
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_MECABANALYZER_HPP_
