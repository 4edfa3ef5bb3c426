/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifdef MORPHEMIZER_HAVE_MECAB


//////////////
// includes //
//////////////
#include <memory>
#include <string>

#include "gtest/gtest.h"

#include "morphemizer/MecabAnalyzer.hpp"
#include "morphemizer/MecabMorphemizer.hpp"
#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


using std::make_shared;
using std::string;


////////////////
// test cases //
////////////////
TEST(MecabAnalyzerTest, invalid_dictionary) {
    MecabAnalyzer analyzer("-d /__not_existing_mecab_dic__");
    EXPECT_THROW(analyzer.analyze(u8"日本語"), ServiceExcept);
    EXPECT_THROW(analyzer.identity(), ServiceExcept);

    MecabMorphemizer mecab(make_shared<MecabAnalyzer>("-d /__not_existing_mecab_dic__"));
    EXPECT_EQ("Japanese UNAVAILABLE", mecab.describe());
    EXPECT_THROW(mecab.segment(u8"日本語"), ServiceExcept);
    EXPECT_EQ(0, mecab.cache().size());
}


TEST(MecabAnalyzerTest, analyze) {
    MecabAnalyzer analyzer;
    string identity;
    try {
        identity = analyzer.identity();
    } catch (const ServiceExcept& exc) {
        GTEST_SKIP() << "no MeCab dictionary: " << exc.what();
    }
    EXPECT_EQ(0, identity.find("MeCab "));

    string text = u8"私は日本語を話す";
    auto morphs = analyzer.analyze(text);
    ASSERT_LT(1, morphs.size());
    string surfaces;
    for (const auto& morph : morphs) {
        EXPECT_FALSE(morph.inflected.empty());    // no BOS/EOS node
        EXPECT_FALSE(morph.pos.empty());
        surfaces += morph.inflected;
    }
    EXPECT_EQ(text, surfaces);
    EXPECT_EQ(0, analyzer.analyze("").size());
}


}    // namespace morphemizer


#endif    // MORPHEMIZER_HAVE_MECAB
