/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/MecabAnalyzer.hpp"

/** Supports spdlog::stderr_color_mt */
#include <spdlog/sinks/stdout_color_sinks.h>


//////////////
// includes //
//////////////
#include <utility>

#include "fmt/format.h"
#include "mecab.h"

#include "morphemizer/MecabFeature.hpp"
#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_lock;
using std::vector;


////////////////////
// static members //
////////////////////
shared_ptr<spdlog::logger> MecabAnalyzer::_log = spdlog::stderr_color_mt("MecabAnalyzer");


////////////////////
// ctors and dtor //
////////////////////
MecabAnalyzer::MecabAnalyzer(string args): _args(std::move(args)) {}


MecabAnalyzer::~MecabAnalyzer() = default;


/////////////
// methods //
/////////////
vector<Morpheme> MecabAnalyzer::analyze(const string& text) {
    unique_lock<mutex> lock(_mutex);
    MeCab::Tagger& tagger = _get_tagger();
    const MeCab::Node* node = tagger.parseToNode(text.c_str(), text.length());
    if (node == nullptr) throw ServiceExcept(fmt::format("fail to parse with MeCab: {}", tagger.what()));

    vector<Morpheme> morphs;
    for (; node != nullptr; node = node->next) {
        if (node->stat == MECAB_BOS_NODE || node->stat == MECAB_EOS_NODE) continue;
        string surface(node->surface, node->length);
        morphs.emplace_back(mecab_morpheme(surface, node->feature != nullptr ? node->feature : ""));
    }
    _log->debug("{} morphemes from: {}", morphs.size(), text);
    return morphs;
}


string MecabAnalyzer::identity() {
    unique_lock<mutex> lock(_mutex);
    MeCab::Tagger& tagger = _get_tagger();
    const MeCab::DictionaryInfo* dic = tagger.dictionary_info();
    string dic_name = dic != nullptr && dic->filename != nullptr ? dic->filename : "unknown";
    return fmt::format("MeCab {} ({})", MeCab::Tagger::version(), dic_name);
}


MeCab::Tagger& MecabAnalyzer::_get_tagger() {
    if (_tagger) return *_tagger;
    _tagger.reset(MeCab::createTagger(_args.c_str()));
    if (!_tagger) {
        const char* err = MeCab::getLastError();
        throw ServiceExcept(fmt::format("fail to create MeCab tagger: {}", err ? err : _args));
    }
    _log->info("MeCab tagger created with args: '{}'", _args);
    return *_tagger;
}


}    // namespace morphemizer
