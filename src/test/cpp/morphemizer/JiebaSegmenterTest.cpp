/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifdef MORPHEMIZER_HAVE_CPPJIEBA


//////////////
// includes //
//////////////
#include <memory>
#include <string>

#include "cxxopts.hpp"
#include "gtest/gtest.h"

#include "morphemizer/JiebaMorphemizer.hpp"
#include "morphemizer/JiebaSegmenter.hpp"
#include "morphemizer/MorphemizerApi.hpp"


///////////////
// variables //
///////////////
extern cxxopts::ParseResult* prog_args;    // arguments passed to main program


namespace morphemizer {


using std::make_shared;
using std::string;


////////////////
// test cases //
////////////////
TEST(JiebaSegmenterTest, no_dictionary) {
    JiebaSegmenter not_configured("");
    EXPECT_THROW(not_configured.cut(u8"中文"), ServiceExcept);

    // directory exists, but no dictionary in it
    JiebaSegmenter empty_dir((*prog_args)["tmp-dir"].as<string>());
    EXPECT_THROW(empty_dir.cut(u8"中文"), ServiceExcept);

    JiebaMorphemizer jieba(make_shared<JiebaSegmenter>(""));
    EXPECT_EQ("Chinese", jieba.describe());
    EXPECT_THROW(jieba.segment(u8"我们"), ServiceExcept);
    EXPECT_EQ(0, jieba.segment("no hanzi").size());
}


TEST(JiebaSegmenterTest, cut) {
    string dict_dir = (*prog_args)["jieba-dict-dir"].as<string>();
    if (dict_dir.empty()) GTEST_SKIP() << "--jieba-dict-dir is not given";

    JiebaSegmenter segmenter(dict_dir);
    string text = u8"我来到北京清华大学";
    auto words = segmenter.cut(text);
    ASSERT_LT(1, words.size());
    string joined;
    for (const auto& word : words) {
        EXPECT_FALSE(word.second.empty());
        joined += word.first;
    }
    EXPECT_EQ(text, joined);

    JiebaMorphemizer jieba(make_shared<JiebaSegmenter>(dict_dir));
    auto morphs = jieba.segment(u8"北京, Beijing!");
    ASSERT_LT(0, morphs.size());
    EXPECT_EQ(u8"北京", morphs[0].base);
}


}    // namespace morphemizer


#endif    // MORPHEMIZER_HAVE_CPPJIEBA
