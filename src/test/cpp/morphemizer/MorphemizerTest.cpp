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

#include "morphemizer/MorphemizerApi.hpp"


namespace morphemizer {


using std::string;
using std::vector;


/**
 * morphemizer without algorithm
 */
class NoopMorphemizer: public Morphemizer {
 public:
    const char* name() const override {
        return "NoopMorphemizer";
    }
};


/**
 * counts how many times the algorithm runs. "!" makes it fail
 */
class CountingMorphemizer: public Morphemizer {
 public:
    mutable int call_cnt = 0;

    explicit CountingMorphemizer(size_t cache_capacity = DEFAULT_CACHE_CAPACITY)
            : Morphemizer(cache_capacity) {}

    const char* name() const override {
        return "CountingMorphemizer";
    }

 protected:
    vector<Morpheme> _segment(const string& expr) const override {
        ++call_cnt;
        if (expr == "!") throw ServiceExcept("failed");
        return {Morpheme::of_token(expr, UNKNOWN_TAG)};
    }
};


////////////////
// test cases //
////////////////
TEST(MorphemizerTest, default_behavior) {
    NoopMorphemizer noop;
    EXPECT_TRUE(noop.segment("anything").empty());
    EXPECT_TRUE(noop.segment("").empty());
    EXPECT_EQ("No information available", noop.describe());
    EXPECT_EQ(Morphemizer::DEFAULT_CACHE_CAPACITY, noop.cache().capacity());
}


TEST(MorphemizerTest, memoize) {
    CountingMorphemizer counting;
    auto first = counting.segment("hello");
    auto second = counting.segment("hello");
    EXPECT_EQ(first, second);
    EXPECT_EQ(1, counting.call_cnt);
    EXPECT_EQ(1, counting.cache().hits());
    EXPECT_EQ(1, counting.cache().misses());

    // exact string is the key
    counting.segment("hello ");
    counting.segment("Hello");
    EXPECT_EQ(3, counting.call_cnt);
}


TEST(MorphemizerTest, evict) {
    CountingMorphemizer counting(2);
    counting.segment("a");
    counting.segment("b");
    counting.segment("c");
    EXPECT_EQ(2, counting.cache().size());
    counting.segment("a");    // evicted before
    EXPECT_EQ(4, counting.call_cnt);
    counting.segment("c");
    EXPECT_EQ(4, counting.call_cnt);
}


TEST(MorphemizerTest, failure_is_not_cached) {
    CountingMorphemizer counting;
    EXPECT_THROW(counting.segment("!"), ServiceExcept);
    EXPECT_THROW(counting.segment("!"), Except);
    EXPECT_EQ(2, counting.call_cnt);
    EXPECT_EQ(0, counting.cache().size());
}


TEST(MorphemizerTest, except) {
    Except exc("message", "file.cpp", 12, "func");
    EXPECT_STREQ("message", exc.what());
    EXPECT_EQ("func(file.cpp:12) message", exc.debug());
    EXPECT_EQ("message", Except("message").debug());
}


}    // namespace morphemizer
