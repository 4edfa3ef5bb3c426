/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_MORPHEME_HPP_
#define INCLUDE_MORPHEMIZER_MORPHEME_HPP_


//////////////
// includes //
//////////////
#include <ostream>
#include <string>


namespace morphemizer {


extern const char* const UNKNOWN_TAG;    ///< tag for unclassified morphemes
extern const char* const CJK_CHAR_TAG;    ///< tag for single CJK ideographs


/**
 * morpheme data structure
 */
class Morpheme {
 public:
    std::string norm;    ///< normalized form
    std::string base;    ///< base (dictionary) form
    std::string inflected;    ///< inflected (surface) form
    std::string read;    ///< reading
    std::string pos;    ///< part-of-speech tag
    std::string sub_pos;    ///< secondary tag

    Morpheme() = default;

    Morpheme(std::string norm, std::string base, std::string inflected, std::string read,
             std::string pos, std::string sub_pos);    ///< ctor

    /**
     * every text field is the same token
     * @param  token  surface token
     * @param  pos  part-of-speech tag
     * @param  sub_pos  secondary tag
     */
    static Morpheme of_token(const std::string& token, const std::string& pos,
                             const std::string& sub_pos = UNKNOWN_TAG);

    bool operator==(const Morpheme& that) const;
    bool operator!=(const Morpheme& that) const;

    std::string str() const;    ///< to string like "base/pos"
};


std::ostream& operator<<(std::ostream& out, const Morpheme& morph);


}    // namespace morphemizer


#endif    // INCLUDE_MORPHEMIZER_MORPHEME_HPP_
