/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/JiebaSegmenter.hpp"

/** Supports spdlog::stderr_color_mt */
#include <spdlog/sinks/stdout_color_sinks.h>


//////////////
// includes //
//////////////
#include <utility>

#include "cppjieba/Jieba.hpp"
#include "fmt/format.h"

#include "morphemizer/MorphemizerApi.hpp"
#include "morphemizer/util.hpp"


namespace morphemizer {


using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_lock;
using std::vector;


////////////////////
// static members //
////////////////////
shared_ptr<spdlog::logger> JiebaSegmenter::_log = spdlog::stderr_color_mt("JiebaSegmenter");


////////////////////
// ctors and dtor //
////////////////////
JiebaSegmenter::JiebaSegmenter(string dict_dir): _dict_dir(std::move(dict_dir)) {}


JiebaSegmenter::~JiebaSegmenter() = default;


/////////////
// methods //
/////////////
vector<ChineseSegmenter::tagged_word_t> JiebaSegmenter::cut(const string& text) {
    vector<tagged_word_t> words;
    _get_jieba().Tag(text, words);
    return words;
}


const cppjieba::Jieba& JiebaSegmenter::_get_jieba() {
    unique_lock<mutex> lock(_mutex);
    if (_jieba) return *_jieba;

    if (_dict_dir.empty()) throw ServiceExcept("jieba dictionary directory is not configured");
    vector<string> paths;
    for (const char* name : {"jieba.dict.utf8", "hmm_model.utf8", "user.dict.utf8", "idf.utf8",
                             "stop_words.utf8"}) {
        paths.emplace_back(fmt::format("{}/{}", _dict_dir, name));
        if (!file_exists(paths.back().c_str())) {
            throw ServiceExcept(fmt::format("jieba dictionary not found: {}", paths.back()));
        }
    }
    _jieba = std::make_unique<cppjieba::Jieba>(paths[0], paths[1], paths[2], paths[3], paths[4]);
    _log->info("jieba dictionaries loaded from {}", _dict_dir);
    return *_jieba;
}


}    // namespace morphemizer
