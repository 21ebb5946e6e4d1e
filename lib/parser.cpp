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
@file      parser.cpp
@brief     wildcard pattern parser that drives a compiler or converter
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/parser.h>
#include <wildcard/debug.h>
#include <wildcard/utf8.h>

namespace wildcard {

void Parser::parse(const std::string& pattern, option_type options)
{
  DBGLOG("BEGIN Parser::parse(\"%s\", %d)", pattern.c_str(), options);

  begin(pattern, options);

  const char *b = pattern.data();
  const char *e = b + pattern.size();
  const char *s = b;

  bool escaped = false; // previous character is an unescaped `
  bool opened = false;  // previous character is the [ that opened a bracket expression
  bool inside = false;  // inside a bracket expression
  size_t open = 0;      // location of the [ that opened the bracket expression
  Members members;

  while (s < e)
  {
    size_t loc = s - b;
    int c = utf8_decode(s, e);

    if (inside)
    {
      if (c == ']' && !opened && !escaped)
      {
        // an unescaped ] closes the bracket expression, bracket expressions do not nest
        inside = false;
        bracket(pattern, members);
        members.clear();
      }
      else if (c != Const::ESC || escaped)
      {
        members.push_back(Member(c, c == '-' && !escaped, loc));
      }

      opened = false;
    }
    else if (c == '*' && !escaped)
    {
      DBGLOGN("%zu: *", loc);
      any_sequence();
    }
    else if (c == '?' && !escaped)
    {
      DBGLOGN("%zu: ?", loc);
      any_one();
    }
    else if (c == '[' && !escaped)
    {
      inside = true;
      opened = true;
      open = loc;
    }
    else if (c != Const::ESC || escaped)
    {
      DBGLOGN("%zu: U+%04X", loc, c);
      literal(c);
    }

    escaped = c == Const::ESC && !escaped;
  }

  if (inside)
    throw pattern_error(pattern_error::mismatched_brackets, pattern, open);

  // a trailing ` is a literal `, except that the pattern ` alone is the empty pattern
  if (escaped && pattern.size() > 1)
    literal(Const::ESC);

  end();

  DBGLOG("END Parser::parse()");
}

void Parser::bracket(const std::string& pattern, const Members& members)
{
  begin_bracket();

  DBGLOGN("[");

  size_t n = members.size();
  size_t i = 0;

  while (i < n)
  {
    if (i + 2 < n && members[i + 1].dash)
    {
      int lo = members[i].chr;
      int hi = members[i + 2].chr;

      if (lo > hi)
        throw pattern_error(pattern_error::invalid_class_range, pattern, members[i].loc);

      DBGLOGA(" U+%04X-U+%04X", lo, hi);
      bracket_range(lo, hi);
      i += 3;
    }
    else
    {
      DBGLOGA(" U+%04X", members[i].chr);
      bracket_literal(members[i].chr);
      ++i;
    }
  }

  DBGLOGA(" ]");

  end_bracket();
}

} // namespace wildcard
