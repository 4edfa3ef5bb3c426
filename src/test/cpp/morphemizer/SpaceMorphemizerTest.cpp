/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */



//////////////
// includes //
//////////////
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "morphemizer/SpaceMorphemizer.hpp"


namespace morphemizer {


using std::string;
using std::vector;


//////////////////
// test fixture //
//////////////////
class SpaceMorphemizerTest: public testing::Test {
 protected:
    SpaceMorphemizer _space;

    vector<string> _bases(const string& expr) {
        vector<string> bases;
        for (const auto& morph : _space.segment(expr)) bases.emplace_back(morph.base);
        return bases;
    }
};


////////////////
// test cases //
////////////////
TEST_F(SpaceMorphemizerTest, name) {
    EXPECT_STREQ("SpaceMorphemizer", _space.name());
    EXPECT_EQ("Language w/ Spaces", _space.describe());
}


TEST_F(SpaceMorphemizerTest, segment) {
    auto morphs = _space.segment("The Quick fox2 jumps");
    ASSERT_EQ(3, morphs.size());
    EXPECT_EQ(Morpheme("the", "the", "the", "the", "UNKNOWN", "UNKNOWN"), morphs[0]);
    EXPECT_EQ("quick", morphs[1].base);
    EXPECT_EQ("jumps", morphs[2].base);
}


TEST_F(SpaceMorphemizerTest, digits) {
    EXPECT_EQ(vector<string>({"abc"}), _bases("abc 2abc abc2 a2c 123"));
    EXPECT_EQ(vector<string>(), _bases(u8"٣٤ ४२"));    // non-ASCII decimal digits
}


TEST_F(SpaceMorphemizerTest, punctuation) {
    EXPECT_EQ(vector<string>({"hello", "world"}), _bases("hello, world!"));
    EXPECT_EQ(vector<string>({"don't", "stop"}), _bases("Don't stop..."));
    EXPECT_EQ(vector<string>({"a-b"}), _bases("(a-b)"));
    EXPECT_EQ(vector<string>(), _bases("... !!! ?"));
}


TEST_F(SpaceMorphemizerTest, unicode) {
    EXPECT_EQ(vector<string>({u8"straße", u8"über", u8"ελλαδα"}),
              _bases(u8"Straße ÜBER ΕΛΛΑΔΑ"));
    EXPECT_EQ(vector<string>({u8"tôi", u8"ăn", u8"bánh_mì"}), _bases(u8"Tôi ăn bánh_mì"));
    EXPECT_EQ(vector<string>({u8"全角", u8"スペース"}), _bases(u8"全角　スペース"));
}


TEST_F(SpaceMorphemizerTest, empty) {
    EXPECT_TRUE(_space.segment("").empty());
    EXPECT_TRUE(_space.segment(" \t\n").empty());
}


}    // namespace morphemizer
