/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_COMPOUNDDICT_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_COMPOUNDDICT_HPP_


//////////////
// includes //
//////////////
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"


namespace morphemizer {


/**
 * multi-word vocabulary entries (compound words) taken from a frequency list.
 * entries are kept in descending order of length (in characters) so that a longer compound
 * is substituted before any shorter compound contained in it.
 */
class CompoundDict {
 public:
    static const char* const STUDY_PLAN_HEADER;    ///< first cell of files which are not frequency lists
    static const char JOINER = '_';    ///< replaces spaces in joined entries

    /**
     * load frequency list. TSV (UTF-8 with optional BOM), first column is the phrase
     * @param  path  file path
     * @return  false if the file is a study plan and was skipped
     */
    bool open(const std::string& path);

    void close();    ///< remove every entry

    /**
     * set entries from phrases. phrases without space are dropped, duplicates keep the first
     * @param  phrases  phrases in file order
     */
    void set_words(const std::vector<std::string>& phrases);

    /**
     * compound words, longest first
     */
    const std::vector<std::string>& words() const {
        return _words;
    }

    /**
     * compound words with spaces replaced by JOINER, same order as words()
     */
    const std::vector<std::string>& joined() const {
        return _joined;
    }

    size_t size() const {
        return _words.size();
    }

 private:
    static std::shared_ptr<spdlog::logger> _log;    ///< logger

    std::vector<std::string> _words;
    std::vector<std::string> _joined;
};


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_COMPOUNDDICT_HPP_
