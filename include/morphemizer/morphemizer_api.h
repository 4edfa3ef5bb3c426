/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2017-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_MORPHEMIZER_API_H_
#define INCLUDE_MORPHEMIZER_MORPHEMIZER_API_H_


///////////////
// constants //
///////////////
#define MORPHEMIZER_VERSION_MAJOR 0
#define MORPHEMIZER_VERSION_MINOR 1
#define _MAC2STR(m) #m
#define _JOIN_VER(x,y) _MAC2STR(x) "." _MAC2STR(y)    // NOLINT
#define MORPHEMIZER_VERSION _JOIN_VER(MORPHEMIZER_VERSION_MAJOR,MORPHEMIZER_VERSION_MINOR)    // NOLINT


#ifdef __cplusplus
extern "C" {
#endif


/**
 * get version string
 * @return   version string like "0.1"
 */
const char* morphemizer_version();


/**
 * set log level of a logger
 * @param  name  logger name. "all" for every logger
 * @param  level  log level. trace, debug, info, warn, err, critical
 * @return  0 if success. -1 if failed
 */
int morphemizer_set_log_level(const char* name, const char* level);


/**
 * set log levels of several loggers at once
 * @param  name_level_pairs  list of (name, level) pairs like "all:warn,console:info,Registry:debug"
 * @return  0 if success. -1 if failed
 */
int morphemizer_set_log_levels(const char* name_level_pairs);


/**
 * get last error
 * @return  message
 */
const char* morphemizer_last_error();


#ifdef __cplusplus
}
#endif


#endif    // INCLUDE_MORPHEMIZER_MORPHEMIZER_API_H_
