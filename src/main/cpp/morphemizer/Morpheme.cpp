/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/Morpheme.hpp"


//////////////
// includes //
//////////////
#include <sstream>
#include <string>
#include <utility>


namespace morphemizer {


using std::ostream;
using std::ostringstream;
using std::string;


///////////////
// constants //
///////////////
const char* const UNKNOWN_TAG = "UNKNOWN";
const char* const CJK_CHAR_TAG = "CJK_CHAR";


////////////////////
// ctors and dtor //
////////////////////
Morpheme::Morpheme(string norm, string base, string inflected, string read, string pos,
                   string sub_pos)
        : norm(std::move(norm)), base(std::move(base)), inflected(std::move(inflected)),
          read(std::move(read)), pos(std::move(pos)), sub_pos(std::move(sub_pos)) {}


/////////////
// methods //
/////////////
Morpheme Morpheme::of_token(const string& token, const string& pos, const string& sub_pos) {
    return Morpheme(token, token, token, token, pos, sub_pos);
}


bool Morpheme::operator==(const Morpheme& that) const {
    return norm == that.norm && base == that.base && inflected == that.inflected &&
           read == that.read && pos == that.pos && sub_pos == that.sub_pos;
}


bool Morpheme::operator!=(const Morpheme& that) const {
    return !(*this == that);
}


string Morpheme::str() const {
    ostringstream oss;
    oss << base << "/" << pos;
    if (sub_pos != UNKNOWN_TAG) oss << "/" << sub_pos;
    return oss.str();
}


ostream& operator<<(ostream& out, const Morpheme& morph) {
    return out << morph.str();
}


}    // namespace morphemizer
