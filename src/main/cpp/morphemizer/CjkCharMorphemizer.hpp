/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_CJKCHARMORPHEMIZER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_CJKCHARMORPHEMIZER_HPP_


//////////////
// includes //
//////////////
#include <string>
#include <vector>

#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


/**
 * splits sentence into characters and keeps Chinese-Japanese-Korean ideographs only
 */
class CjkCharMorphemizer: public Morphemizer {
 public:
    static const char* const NAME;    ///< "CjkCharMorphemizer"

    explicit CjkCharMorphemizer(size_t cache_capacity = DEFAULT_CACHE_CAPACITY);    ///< ctor

    std::string describe() const override;

    const char* name() const override;

 protected:
    std::vector<Morpheme> _segment(const std::string& expr) const override;
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_CJKCHARMORPHEMIZER_HPP_
