/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_JIEBAMORPHEMIZER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_JIEBAMORPHEMIZER_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <string>
#include <vector>

#include "morphemizer/Backend.hpp"
#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


/**
 * Chinese segmentation with the part-of-speech segmenter of Jieba
 */
class JiebaMorphemizer: public Morphemizer {
 public:
    static const char* const NAME;    ///< "JiebaMorphemizer"

    /**
     * @param  segmenter  Chinese part-of-speech segmenter
     * @param  cache_capacity  maximum number of cached expressions
     */
    explicit JiebaMorphemizer(std::shared_ptr<ChineseSegmenter> segmenter,
                              size_t cache_capacity = DEFAULT_CACHE_CAPACITY);

    std::string describe() const override;

    const char* name() const override;

 protected:
    std::vector<Morpheme> _segment(const std::string& expr) const override;

 private:
    std::shared_ptr<ChineseSegmenter> _segmenter;
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_JIEBAMORPHEMIZER_HPP_
