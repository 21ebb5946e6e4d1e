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
@file      convert.h
@brief     convert wildcard patterns to regex, DOS and WQL syntax
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

The converters render a wildcard pattern in the syntax of another pattern
language, for example to hand over a pattern to a regex engine or to a query
that filters on the server side.

Conversions:

| wildcard | regex       | DOS | WQL      |
| -------- | ----------- | --- | -------- |
| `*`      | `.*`        | `*` | `%`      |
| `?`      | `.`         | `?` | `_`      |
| `[a-z]`  | `[a-z]`     | `?` | `_` (1)  |
| `` `* `` | `\*`        | `*` | `*`      |
| `%`      | `%`         | `%` | `[%]`    |

(1) needs filtering on the client side, the range is lost.

The regex is anchored with `^` and `$`, except that a leading `^.*` and a
trailing `.*$` are removed, and `*` converts to the empty regex.
*/

#ifndef WILDCARD_CONVERT_H
#define WILDCARD_CONVERT_H

#include <wildcard/parser.h>
#include <string>

namespace wildcard {

/// Convert a wildcard pattern to a regex.
class RegexConverter : public Parser {
 public:
  /// Returns the regex for the given wildcard pattern, throws pattern_error.
  static std::string convert(const std::string& pattern);
 protected:
  virtual void begin(const std::string& pattern, option_type options);
  virtual void end();
  virtual void literal(int c);
  virtual void any_sequence();
  virtual void any_one();
  virtual void begin_bracket();
  virtual void bracket_literal(int c);
  virtual void bracket_range(int lo, int hi);
  virtual void end_bracket();
  /// Append regex character c to regex, escaped when c is a regex meta character.
  static void append(std::string& regex, int c);
  /// Append character c to a regex bracket list.
  static void append_bracket(std::string& regex, int c);
  std::string rex_; ///< regex produced
};

/// Convert a wildcard pattern to a DOS wildcard pattern with `*` and `?` only.
class DosConverter : public Parser {
 public:
  /// Returns the DOS wildcard pattern for the given wildcard pattern, throws pattern_error.
  static std::string convert(const std::string& pattern);
 protected:
  virtual void literal(int c);
  virtual void any_sequence();
  virtual void any_one();
  virtual void begin_bracket()
  { }
  virtual void bracket_literal(int)
  { }
  virtual void bracket_range(int, int)
  { }
  virtual void end_bracket();
  std::string dos_; ///< DOS pattern produced
};

/// Convert a wildcard pattern to the right-hand side operand of a WQL LIKE operator.
class WqlConverter : public Parser {
 public:
  /// Returns the WQL LIKE operand for the given wildcard pattern, throws pattern_error.
  static std::string convert(
      const std::string& pattern, ///< wildcard pattern
      bool&              filter); ///< set to true when the operand matches more than the pattern and results need filtering on the client side
 protected:
  virtual void literal(int c);
  virtual void any_sequence();
  virtual void any_one();
  virtual void begin_bracket()
  { }
  virtual void bracket_literal(int)
  { }
  virtual void bracket_range(int, int)
  { }
  virtual void end_bracket();
  WqlConverter()
    :
      flt_(false)
  { }
  std::string wql_; ///< WQL operand produced
  bool        flt_; ///< true when filtering on the client side is needed
};

} // namespace wildcard

#endif
