/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2017-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_MORPHEMIZERAPI_HPP_
#define INCLUDE_MORPHEMIZER_MORPHEMIZERAPI_HPP_



//////////////
// includes //
//////////////
#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include "morphemizer/LruCache.hpp"
#include "morphemizer/Morpheme.hpp"
#include "morphemizer/morphemizer_api.h"


namespace morphemizer {


/**
 * common interface of segmentation strategies.
 * results are memoized per instance, keyed by the exact input expression.
 */
class Morphemizer {
 public:
    using cache_t = LruCache<std::string, std::vector<Morpheme>>;

    static const size_t DEFAULT_CACHE_CAPACITY = 131072;    ///< default number of cached expressions

    /**
     * @param  cache_capacity  maximum number of cached expressions
     */
    explicit Morphemizer(size_t cache_capacity = DEFAULT_CACHE_CAPACITY);

    virtual ~Morphemizer() = default;    ///< dtor

    Morphemizer(const Morphemizer&) = delete;    ///< delete copy constructor
    Morphemizer& operator=(const Morphemizer&) = delete;    ///< delete assignment operator

    /**
     * convert an expression to a list of its morphemes
     * @param  expr  expression (UTF-8)
     * @return  morphemes in order of occurrence
     */
    std::vector<Morpheme> segment(const std::string& expr) const;

    /**
     * a single line telling which languages this morphemizer is for. never throws
     * @return  description
     */
    virtual std::string describe() const;

    /**
     * unique name of this morphemizer, used as key in registry
     * @return  name
     */
    virtual const char* name() const = 0;

    const cache_t& cache() const {
        return _cache;
    }

 protected:
    /**
     * segmentation algorithm without memoization
     * @param  expr  expression (UTF-8)
     * @return  morphemes
     */
    virtual std::vector<Morpheme> _segment(const std::string& expr) const;

 private:
    mutable cache_t _cache;    ///< expression -> morphemes
};


/**
 * standard exception thrown by morphemizer api
 */
class Except: public std::exception {
 public:
    /**
     * @param  msg  error message
     * @param  file  source file (for debug)
     * @param  line  line number in source file (for debug)
     * @param  func  function name (for debug)
     */
    explicit Except(std::string msg, const char* file = nullptr, const int line = 0,
                    const char* func = nullptr);

    virtual const char* what() const noexcept;

    std::string debug() const;    ///< message with some debug information

 private:
    std::string _msg;    ///< error message
    const char* _file = nullptr;    ///< source file
    int _line = 0;    ///< line number in source file
    const char* _func = nullptr;    ///< function name
};


/**
 * failure of an external analysis service (analyzer or segmenter) while segmenting
 */
class ServiceExcept: public Except {
 public:
    using Except::Except;
};


}    // namespace morphemizer


#endif    // INCLUDE_MORPHEMIZER_MORPHEMIZERAPI_HPP_
