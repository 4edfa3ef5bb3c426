/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_CONFIG_HPP_
#define INCLUDE_MORPHEMIZER_CONFIG_HPP_


//////////////
// includes //
//////////////
#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"


namespace morphemizer {


/**
 * JSON format preferences
 */
class Config {
 public:
    size_t cache_capacity;    ///< number of cached expressions per morphemizer

    Config();    ///< ctor
    Config(const Config&) = delete;    ///< delete copy constructor
    Config& operator=(const Config&) = delete;    ///< delete assignment operator

    /**
     * read preferences from file
     * @param  path  file path
     */
    void read_from_file(const std::string& path);

    /**
     * override preferences with JSON option
     * @param  opt_str  option string (JSON format)
     */
    void override_from_str(const char* opt_str);

    /**
     * get a preference value
     * @param  key  preference key (ex: "path_frequency")
     * @return  value. empty string if the key is absent or its value is not a string
     */
    std::string get_preference(const std::string& key) const;

 private:
    nlohmann::json _prefs;    ///< preferences merged from file and options

    /**
     * merge JSON object into preferences and validate known members
     * @param  jsn  JSON object
     */
    void _merge(const nlohmann::json& jsn);
};


}    // namespace morphemizer


#endif    // INCLUDE_MORPHEMIZER_CONFIG_HPP_
