/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/Cjk.hpp"


//////////////
// includes //
//////////////
#include <algorithm>
#include <iterator>

#include "morphemizer/util.hpp"


namespace morphemizer {


using std::begin;
using std::end;
using std::string;
using std::u32string;
using std::vector;


///////////////
// constants //
///////////////
namespace {

struct range_t {
    char32_t first;
    char32_t last;
};

/** sorted by code point */
const range_t _CJK_RANGES[] = {
    {0x2E80, 0x2EF3},    // CJK Radicals Supplement
    {0x2F00, 0x2FD5},    // Kangxi Radicals
    {0x3007, 0x3007},    // ideographic number zero
    {0x3400, 0x4DBF},    // CJK Unified Ideographs Extension A
    {0x4E00, 0x9FFF},    // CJK Unified Ideographs
    {0xF900, 0xFAFF},    // CJK Compatibility Ideographs
    {0x20000, 0x2A6DF},    // CJK Unified Ideographs Extension B
    {0x2A700, 0x2B73F},    // CJK Unified Ideographs Extension C
    {0x2B740, 0x2B81F},    // CJK Unified Ideographs Extension D
    {0x2F800, 0x2FA1F},    // CJK Compatibility Ideographs Supplement
};

}    // namespace


///////////////
// functions //
///////////////
bool is_cjk_ideograph(char32_t chr) {
    auto found = std::upper_bound(begin(_CJK_RANGES), end(_CJK_RANGES), chr,
                                  [](char32_t val, const range_t& rng) { return val < rng.first; });
    if (found == begin(_CJK_RANGES)) return false;
    --found;
    return chr <= found->last;
}


vector<string> cjk_chars(const string& text) {
    vector<string> chars;
    for (char32_t chr : utf8_to_wstr(text)) {
        if (is_cjk_ideograph(chr)) chars.emplace_back(wstr_to_utf8(u32string(1, chr)));
    }
    return chars;
}


string filter_cjk(const string& text) {
    u32string wtext = utf8_to_wstr(text);
    u32string filtered;
    std::copy_if(wtext.begin(), wtext.end(), std::back_inserter(filtered), is_cjk_ideograph);
    return wstr_to_utf8(filtered);
}


}    // namespace morphemizer
