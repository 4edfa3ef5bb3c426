/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */



//////////////
// includes //
//////////////
#include "gtest/gtest.h"

#include "morphemizer/MecabFeature.hpp"


namespace morphemizer {


////////////////
// test cases //
////////////////
TEST(MecabFeatureTest, ipadic) {
    auto morph = mecab_morpheme(u8"食べ", u8"動詞,自立,*,*,一段,連用形,食べる,タベ,タベ");
    EXPECT_EQ(u8"食べる", morph.norm);
    EXPECT_EQ(u8"食べる", morph.base);
    EXPECT_EQ(u8"食べ", morph.inflected);
    EXPECT_EQ(u8"タベ", morph.read);
    EXPECT_EQ(u8"動詞", morph.pos);
    EXPECT_EQ(u8"自立", morph.sub_pos);
}


TEST(MecabFeatureTest, asterisk_falls_back_to_surface) {
    auto morph = mecab_morpheme(u8"ＡＢＣ", u8"名詞,固有名詞,組織,*,*,*,*");
    EXPECT_EQ(u8"ＡＢＣ", morph.base);
    EXPECT_EQ(u8"ＡＢＣ", morph.norm);
    EXPECT_EQ(u8"ＡＢＣ", morph.read);    // no reading field
    EXPECT_EQ(u8"名詞", morph.pos);
    EXPECT_EQ(u8"固有名詞", morph.sub_pos);
}


TEST(MecabFeatureTest, unknown_word) {
    auto morph = mecab_morpheme("xyz", u8"名詞");
    EXPECT_EQ("xyz", morph.base);
    EXPECT_EQ(u8"名詞", morph.pos);
    EXPECT_EQ("UNKNOWN", morph.sub_pos);

    morph = mecab_morpheme("xyz", "");
    EXPECT_EQ("xyz", morph.base);
    EXPECT_EQ("UNKNOWN", morph.pos);
    EXPECT_EQ("UNKNOWN", morph.sub_pos);
}


}    // namespace morphemizer
