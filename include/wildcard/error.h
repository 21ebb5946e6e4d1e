/******************************************************************************\
* Copyright (c) 2016, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      error.h
@brief     wildcard pattern syntax and conversion errors
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef WILDCARD_ERROR_H
#define WILDCARD_ERROR_H

#include <cstdio>
#include <stdexcept>
#include <string>

namespace wildcard {

/// Convert a size to a decimal string.
inline std::string ztoa(size_t n)
{
  char buf[24];
  snprintf(buf, sizeof(buf), "%zu", n);
  return std::string(buf);
}

/// Wildcard pattern syntax error exception error code.
typedef int pattern_error_type;

/// Wildcard pattern syntax error exceptions, thrown when a pattern is constructed or converted.
class pattern_error : public std::runtime_error {
 public:
  static const pattern_error_type mismatched_brackets = 0; ///< bracket expression `[...` is not closed
  static const pattern_error_type invalid_class_range = 1; ///< bracket expression range is inverted, e.g. `[z-a]`
  static const pattern_error_type invalid_regex       = 2; ///< regex rendering of the pattern is rejected by the regex library
  /// Construct pattern error info.
  pattern_error(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos = 0)
    :
      std::runtime_error(pattern_error_message(code, pattern, pos)),
      code_(code),
      pos_(pos),
      pat_(pattern)
  { }
  /// Returns error code, a wildcard::pattern_error_type constant.
  pattern_error_type code()
    const
  {
    return code_;
  }
  /// Returns byte position of the error in the pattern.
  size_t pos()
    const
  {
    return pos_;
  }
  /// Returns the invalid pattern.
  const std::string& pattern()
    const
  {
    return pat_;
  }
  /// Returns the stable error identifier of all pattern syntax errors.
  static const char *id()
  {
    return "WildcardPattern_Invalid";
  }
  virtual ~pattern_error() throw()
  { }
 private:
  static std::string pattern_error_message(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos);
  static size_t displen(const char *s, size_t k);
  pattern_error_type code_;
  size_t             pos_;
  std::string        pat_;
};

/// Conversion error exceptions, thrown when a pattern cannot be rendered in a target query language without client-side filtering.
class conversion_error : public std::runtime_error {
 public:
  /// Construct conversion error info.
  conversion_error(
      const std::string& pattern,
      const char        *target)
    :
      std::runtime_error(conversion_error_message(pattern, target)),
      pat_(pattern),
      tgt_(target != NULL ? target : "")
  { }
  /// Returns the pattern that could not be converted.
  const std::string& pattern()
    const
  {
    return pat_;
  }
  /// Returns the name of the target language, e.g. "WQL".
  const std::string& target()
    const
  {
    return tgt_;
  }
  /// Returns the stable error identifier of unsupported conversions.
  static const char *id()
  {
    return "UnsupportedWildcardToWqlConversion";
  }
  virtual ~conversion_error() throw()
  { }
 private:
  static std::string conversion_error_message(
      const std::string& pattern,
      const char        *target);
  std::string pat_;
  std::string tgt_;
};

} // namespace wildcard

#endif
