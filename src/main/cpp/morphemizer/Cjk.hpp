/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_CJK_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_CJK_HPP_


//////////////
// includes //
//////////////
#include <string>
#include <vector>


namespace morphemizer {


/**
 * whether the character is a CJK ideograph (unified, compatibility, extensions and radicals)
 * @param  chr  character
 * @return  true if CJK ideograph
 */
bool is_cjk_ideograph(char32_t chr);


/**
 * CJK ideographs in the text, one string per character
 * @param  text  UTF-8 text
 * @return  list of characters (UTF-8)
 */
std::vector<std::string> cjk_chars(const std::string& text);


/**
 * remove every character which is not a CJK ideograph
 * @param  text  UTF-8 text
 * @return  CJK ideographs only (UTF-8)
 */
std::string filter_cjk(const std::string& text);


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_CJK_HPP_
