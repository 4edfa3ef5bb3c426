/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_SPACEMORPHEMIZER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_SPACEMORPHEMIZER_HPP_


//////////////
// includes //
//////////////
#include <string>
#include <vector>

#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


/**
 * morphemizer for languages that use spaces (English, German, Spanish, ...).
 * it can't generate the base form from inflection.
 */
class SpaceMorphemizer: public Morphemizer {
 public:
    static const char* const NAME;    ///< "SpaceMorphemizer"

    /**
     * @param  cache_capacity  maximum number of cached expressions
     */
    explicit SpaceMorphemizer(size_t cache_capacity = DEFAULT_CACHE_CAPACITY);

    std::string describe() const override;

    const char* name() const override;

    /**
     * lowercased runs of non-space, non-digit characters between word boundaries.
     * a run containing a digit is skipped entirely.
     * @param  expr  expression (UTF-8)
     * @return  morphemes tagged UNKNOWN
     */
    static std::vector<Morpheme> split_words(const std::string& expr);

 protected:
    std::vector<Morpheme> _segment(const std::string& expr) const override;
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_SPACEMORPHEMIZER_HPP_
