/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_MECABMORPHEMIZER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_MECABMORPHEMIZER_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "morphemizer/Backend.hpp"
#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


/**
 * Japanese has no spaces between morphemes, so an external analyzer (MeCab) is used
 */
class MecabMorphemizer: public Morphemizer {
 public:
    static const char* const NAME;    ///< "MecabMorphemizer"

    /**
     * @param  analyzer  Japanese morphological analyzer
     * @param  cache_capacity  maximum number of cached expressions
     */
    explicit MecabMorphemizer(std::shared_ptr<JapaneseAnalyzer> analyzer,
                              size_t cache_capacity = DEFAULT_CACHE_CAPACITY);

    /**
     * "Japanese " followed by analyzer identity, or UNAVAILABLE if the analyzer can't tell it
     * @return  description
     */
    std::string describe() const override;

    const char* name() const override;

 protected:
    std::vector<Morpheme> _segment(const std::string& expr) const override;

 private:
    static std::shared_ptr<spdlog::logger> _log;    ///< logger

    std::shared_ptr<JapaneseAnalyzer> _analyzer;
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_MECABMORPHEMIZER_HPP_
