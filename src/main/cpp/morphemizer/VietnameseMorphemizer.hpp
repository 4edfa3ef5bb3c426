/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_VIETNAMESEMORPHEMIZER_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_VIETNAMESEMORPHEMIZER_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "morphemizer/CompoundDict.hpp"
#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


/**
 * Vietnamese has many compound words whose syllables are divided by spaces.
 * compounds from a frequency list are joined before splitting by spaces.
 */
class VietnameseMorphemizer: public Morphemizer {
 public:
    static const char* const NAME;    ///< "VietnameseMorphemizer"

    /**
     * load compound words. any failure leaves no compound words (same as SpaceMorphemizer)
     * @param  freq_path  frequency list path. empty if not configured
     * @param  cache_capacity  maximum number of cached expressions
     */
    explicit VietnameseMorphemizer(const std::string& freq_path,
                                   size_t cache_capacity = DEFAULT_CACHE_CAPACITY);

    std::string describe() const override;

    const char* name() const override;

    const CompoundDict& compounds() const {
        return _compounds;
    }

 protected:
    std::vector<Morpheme> _segment(const std::string& expr) const override;

 private:
    static std::shared_ptr<spdlog::logger> _log;    ///< logger

    CompoundDict _compounds;    ///< read-only after construction
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_VIETNAMESEMORPHEMIZER_HPP_
