/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/MecabFeature.hpp"


//////////////
// includes //
//////////////
#include <vector>

#include "morphemizer/util.hpp"


namespace morphemizer {


using std::string;
using std::vector;


///////////////
// functions //
///////////////
namespace {

inline const string& _field_or(const vector<string>& features, size_t idx, const string& surface) {
    if (idx >= features.size() || features[idx] == "*" || features[idx].empty()) return surface;
    return features[idx];
}

}    // namespace


Morpheme mecab_morpheme(const string& surface, const string& feature) {
    auto features = split(feature.c_str(), ',');
    const string& base = _field_or(features, 6, surface);
    const string& read = _field_or(features, 7, surface);
    string pos = features.size() > 0 && !features[0].empty() ? features[0] : UNKNOWN_TAG;
    string sub_pos = features.size() > 1 && !features[1].empty() ? features[1] : UNKNOWN_TAG;
    return Morpheme(base, base, surface, read, pos, sub_pos);
}


}    // namespace morphemizer
