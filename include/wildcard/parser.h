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
@file      parser.h
@brief     wildcard pattern parser that drives a compiler or converter
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

The parser scans a wildcard pattern once from left to right and invokes the
virtual methods of a derived class for each construct found.  The matcher
compiler and the regex, DOS and WQL converters derive from this class.

Wildcard syntax:

    *      matches zero or more characters
    ?      matches any one character
    [abc]  matches one character in the bracket list
    [a-z]  matches one character in the selected range of characters
    `x     matches x literally, where x may be *, ?, [, ], ` or any character

A `]` right after the opening `[` is a member of the bracket list, a `-` that
is not between two members is a member too.  There are no inverted bracket
lists, `^` and `!` are members like any other character.
*/

#ifndef WILDCARD_PARSER_H
#define WILDCARD_PARSER_H

#include <wildcard/error.h>
#include <wildcard/options.h>
#include <string>
#include <vector>

namespace wildcard {

/// Wildcard pattern parser base class.
class Parser {
 public:
  /// Common constants.
  struct Const {
    static const int ESC = '`'; ///< the escape character of wildcard patterns
  };
  virtual ~Parser()
  { }
  /// Parse a UTF-8 wildcard pattern and invoke the callbacks, throws pattern_error.
  void parse(
      const std::string& pattern,                   ///< wildcard pattern
      option_type        options = option::none);   ///< options passed on to begin()
 protected:
  /// Called first, before any other callback.
  virtual void begin(
      const std::string& pattern,
      option_type        options)
  {
    (void)pattern;
    (void)options;
  }
  /// Called last, after all other callbacks.
  virtual void end()
  { }
  /// A literal character c.
  virtual void literal(int c) = 0;
  /// A `*` matching zero or more characters.
  virtual void any_sequence() = 0;
  /// A `?` matching one character.
  virtual void any_one() = 0;
  /// A bracket expression begins.
  virtual void begin_bracket() = 0;
  /// A literal character c in a bracket expression.
  virtual void bracket_literal(int c) = 0;
  /// A character range lo-hi in a bracket expression, lo <= hi.
  virtual void bracket_range(int lo, int hi) = 0;
  /// A bracket expression ends.
  virtual void end_bracket() = 0;
 private:
  /// Member of a bracket expression as parsed.
  struct Member {
    Member(int chr, bool dash, size_t loc)
      :
        chr(chr),
        dash(dash),
        loc(loc)
    { }
    int    chr;  ///< code point
    bool   dash; ///< true if an unescaped `-`
    size_t loc;  ///< byte offset in the pattern
  };
  typedef std::vector<Member> Members;
  /// Invoke the bracket callbacks for the members of a bracket expression.
  void bracket(const std::string& pattern, const Members& members);
};

} // namespace wildcard

#endif
