/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */



//////////////
// includes //
//////////////
#include <memory>
#include <string>

#include "gtest/gtest.h"

#include "morphemizer/FakeBackend.hpp"
#include "morphemizer/JiebaMorphemizer.hpp"


namespace morphemizer {


using std::make_shared;
using std::shared_ptr;
using std::string;


//////////////////
// test fixture //
//////////////////
class JiebaMorphemizerTest: public testing::Test {
 protected:
    shared_ptr<FakeSegmenter> _segmenter = make_shared<FakeSegmenter>();
    JiebaMorphemizer _jieba{_segmenter};
};


////////////////
// test cases //
////////////////
TEST_F(JiebaMorphemizerTest, name) {
    EXPECT_STREQ("JiebaMorphemizer", _jieba.name());
    EXPECT_EQ("Chinese", _jieba.describe());
    EXPECT_THROW(JiebaMorphemizer(nullptr), Except);
}


TEST_F(JiebaMorphemizerTest, segment) {
    _segmenter->words = {{u8"我", "r"}, {u8"爱", "v"}, {u8"北京", "ns"}};
    auto morphs = _jieba.segment(u8"我爱 Beijing, 北京！");

    ASSERT_EQ(1, _segmenter->inputs.size());
    EXPECT_EQ(u8"我爱北京", _segmenter->inputs[0]);    // CJK only

    ASSERT_EQ(3, morphs.size());
    EXPECT_EQ(Morpheme(u8"我", u8"我", u8"我", u8"我", "r", "UNKNOWN"), morphs[0]);
    EXPECT_EQ(u8"爱", morphs[1].base);
    EXPECT_EQ("v", morphs[1].pos);
    EXPECT_EQ(u8"北京", morphs[2].inflected);
    EXPECT_EQ("ns", morphs[2].pos);
}


TEST_F(JiebaMorphemizerTest, no_cjk) {
    EXPECT_TRUE(_jieba.segment("hello, world").empty());
    EXPECT_TRUE(_jieba.segment("").empty());
    EXPECT_TRUE(_segmenter->inputs.empty());
}


TEST_F(JiebaMorphemizerTest, service_error) {
    _segmenter->is_down = true;
    EXPECT_THROW(_jieba.segment(u8"中文"), ServiceExcept);
}


}    // namespace morphemizer
