/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2017-, Kakao Corp. All rights reserved.
 */

#ifndef SRC_MAIN_CPP_MORPHEMIZER_UTIL_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_UTIL_HPP_

//////////////
// includes //
//////////////
#ifdef _WIN32
#include <shlwapi.h>
#else
#include <sys/stat.h>
#endif    // _WIN32

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "boost/locale/encoding_utf.hpp"
#include "unicode/uchar.h"
#include "unicode/unistr.h"
#include "unicode/locid.h"


namespace morphemizer {
    ///////////////
    // functions //
    ///////////////
    /**
     * whether is space or not (the same set as str.isspace() of Unicode strings)
     * @param  chr  character
     * @return  true if character is space
     */
    inline bool is_space(char32_t chr) {
        static std::u32string space(U" \t\n\v\f\r\x1c\x1d\x1e\x1f\x85\u00a0\u1680"
                                    U"\u2000\u2001\u2002\u2003\u2004\u2005\u2006\u2007\u2008\u2009\u200a"
                                    U"\u2028\u2029\u202f\u205f\u3000");
        return space.find(chr) != std::u32string::npos;
    }

    /**
     * whether is decimal digit (general category Nd) or not
     * @param  chr  character
     * @return  true if character is digit
     */
    inline bool is_digit(char32_t chr) {
        return u_charType(static_cast<UChar32>(chr)) == U_DECIMAL_DIGIT_NUMBER;
    }

    /**
     * whether is word character (letter, number or underscore) or not
     * @param  chr  character
     * @return  true if character is word character
     */
    inline bool is_word_char(char32_t chr) {
        if (chr == U'_') return true;
        return (U_GET_GC_MASK(static_cast<UChar32>(chr)) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
    }

    /**
     * convert UTF-8 string to u32string
     * @param str  UTF-8 string
     * @return  u32string
     */
    inline std::u32string utf8_to_wstr(const std::string& str) {
        return boost::locale::conv::utf_to_utf<char32_t>(str);
    }

    /**
     * convert u32string to UTF-8 string
     * @param  wstr  u32string
     * @return  UTF-8 string
     */
    inline std::string wstr_to_utf8(const std::u32string& wstr) {
        return boost::locale::conv::utf_to_utf<char>(wstr);
    }

    /**
     * full Unicode lowercase mapping
     * @param  str  UTF-8 string
     * @return  lowercased UTF-8 string
     */
    inline std::string to_lower(const std::string& str) {
        std::string lowered;
        icu::UnicodeString::fromUTF8(icu::StringPiece(str.data(), static_cast<int32_t>(str.size())))
            .toLower(icu::Locale::getRoot()).toUTF8String(lowered);
        return lowered;
    }

    /**
     * replace every non-overlapping occurrence, scanning from left to right
     * @param  str  string to modify
     * @param  from  text to find (not empty)
     * @param  to  replacement
     * @return  number of replacements
     */
    inline int replace_all(std::string* str, const std::string& from, const std::string& to) {
        if (from.empty()) return 0;
        int cnt = 0;
        for (size_t pos = str->find(from); pos != std::string::npos;
             pos = str->find(from, pos + to.length())) {
            str->replace(pos, from.length(), to);
            ++cnt;
        }
        return cnt;
    }

    /**
     * string splitter
     * @param  str  string to split
     * @param  deilm  delimiter char
     * @return  list of splitted strings
     */
    inline std::vector<std::string> split(const char* str, char delim) {
        std::stringstream sss(str);
        std::vector<std::string> elems;
        for (std::string item; std::getline(sss, item, delim);) {
            elems.emplace_back(std::move(item));
        }
        return elems;
    }

    /**
     * whether file (or directory) exists or not
     * @param  path  path
     * @return  true if exists
     */
    inline bool file_exists(const char* path) {
#ifdef _WIN32
        return PathFileExistsA(path);
#else
        struct stat st;
        return stat(path, &st) == 0;
#endif    // _WIN32
    }
}    // namespace morphemizer

#endif    // SRC_MAIN_CPP_MORPHEMIZER_UTIL_HPP_
