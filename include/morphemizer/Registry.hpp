/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_REGISTRY_HPP_
#define INCLUDE_MORPHEMIZER_REGISTRY_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <mutex>    // NOLINT
#include <string>
#include <unordered_map>
#include <vector>

#include "boost/optional.hpp"
#include "spdlog/spdlog.h"

#include "morphemizer/Backend.hpp"
#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


class Config;


/**
 * the fixed set of morphemizers. built once on first access, in this order:
 * SpaceMorphemizer, MecabMorphemizer, JiebaMorphemizer, CjkCharMorphemizer, VietnameseMorphemizer
 */
class Registry {
 public:
    /**
     * @param  cfg  preferences. must outlive the first call of all()
     * @param  analyzer  Japanese analyzer for MecabMorphemizer
     * @param  segmenter  Chinese segmenter for JiebaMorphemizer
     */
    Registry(const Config& cfg, std::shared_ptr<JapaneseAnalyzer> analyzer,
             std::shared_ptr<ChineseSegmenter> segmenter);

    Registry(const Registry&) = delete;    ///< delete copy constructor
    Registry& operator=(const Registry&) = delete;    ///< delete assignment operator

    /**
     * every morphemizer. the same instances in the same order on every call
     * @return  morphemizers
     */
    const std::vector<std::shared_ptr<Morphemizer>>& all();

    /**
     * find morphemizer by its name
     * @param  name  name
     * @return  morphemizer. boost::none if no morphemizer has the name
     */
    boost::optional<Morphemizer&> by_name(const std::string& name);

 private:
    static std::shared_ptr<spdlog::logger> _log;    ///< logger

    const Config& _cfg;    ///< preferences
    std::shared_ptr<JapaneseAnalyzer> _analyzer;
    std::shared_ptr<ChineseSegmenter> _segmenter;

    std::mutex _mutex;    ///< mutex to build exclusively
    bool _is_built = false;
    std::vector<std::shared_ptr<Morphemizer>> _morphemizers;
    std::unordered_map<std::string, std::shared_ptr<Morphemizer>> _by_name;

    void _build();    ///< create morphemizers (mutex is held)
};


}    // namespace morphemizer


#endif    // INCLUDE_MORPHEMIZER_REGISTRY_HPP_
