/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef SRC_MAIN_CPP_MORPHEMIZER_MECABFEATURE_HPP_
#define SRC_MAIN_CPP_MORPHEMIZER_MECABFEATURE_HPP_


//////////////
// includes //
//////////////
#include <string>

#include "morphemizer/Morpheme.hpp"


namespace morphemizer {


/**
 * make morpheme from a MeCab node.
 * feature is IPADIC format: pos,sub_pos1,sub_pos2,sub_pos3,conj_type,conj_form,base,reading,...
 * base and reading fall back to the surface when they are absent or "*"
 * @param  surface  surface of the node
 * @param  feature  comma separated features of the node
 * @return  morpheme
 */
Morpheme mecab_morpheme(const std::string& surface, const std::string& feature);


}    // namespace morphemizer


#endif    // SRC_MAIN_CPP_MORPHEMIZER_MECABFEATURE_HPP_
