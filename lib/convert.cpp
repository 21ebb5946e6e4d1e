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
@file      convert.cpp
@brief     convert wildcard patterns to regex, DOS and WQL syntax
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/convert.h>
#include <wildcard/debug.h>
#include <wildcard/utf8.h>
#include <cstring>

namespace wildcard {

// regex meta characters to escape, ] is not a meta character outside of a bracket list
static const char *regex_meta = "()[.?*{}^$+|\\";

std::string RegexConverter::convert(const std::string& pattern)
{
  RegexConverter converter;
  converter.parse(pattern);
  DBGLOG("RegexConverter \"%s\" to \"%s\"", pattern.c_str(), converter.rex_.c_str());
  return converter.rex_;
}

void RegexConverter::begin(const std::string& pattern, option_type)
{
  rex_.clear();
  rex_.reserve(2 * pattern.size() + 2);
  rex_.push_back('^');
}

void RegexConverter::end()
{
  rex_.push_back('$');
  if (rex_ == "^.*$")
  {
    rex_.clear();
  }
  else
  {
    bool head = rex_.compare(0, 3, "^.*") == 0;
    bool tail = rex_.size() >= 3 && rex_.compare(rex_.size() - 3, 3, ".*$") == 0;
    if (tail)
      rex_.resize(rex_.size() - 3);
    if (head)
      rex_.erase(0, 3);
  }
}

void RegexConverter::append(std::string& regex, int c)
{
  if (c > 0 && c < 0x80 && std::strchr(regex_meta, c) != NULL)
    regex.push_back('\\');
  utf8_encode(c, regex);
}

void RegexConverter::append_bracket(std::string& regex, int c)
{
  switch (c)
  {
    case '[':
      regex.push_back('[');
      break;
    case ']':
      regex.append("\\]");
      break;
    case '-':
      regex.append("\\x2d");
      break;
    default:
      append(regex, c);
  }
}

void RegexConverter::literal(int c)
{
  append(rex_, c);
}

void RegexConverter::any_sequence()
{
  rex_.append(".*");
}

void RegexConverter::any_one()
{
  rex_.push_back('.');
}

void RegexConverter::begin_bracket()
{
  rex_.push_back('[');
}

void RegexConverter::bracket_literal(int c)
{
  append_bracket(rex_, c);
}

void RegexConverter::bracket_range(int lo, int hi)
{
  append_bracket(rex_, lo);
  rex_.push_back('-');
  append_bracket(rex_, hi);
}

void RegexConverter::end_bracket()
{
  rex_.push_back(']');
}

std::string DosConverter::convert(const std::string& pattern)
{
  DosConverter converter;
  converter.parse(pattern);
  return converter.dos_;
}

void DosConverter::literal(int c)
{
  utf8_encode(c, dos_);
}

void DosConverter::any_sequence()
{
  dos_.push_back('*');
}

void DosConverter::any_one()
{
  dos_.push_back('?');
}

void DosConverter::end_bracket()
{
  dos_.push_back('?');
}

std::string WqlConverter::convert(const std::string& pattern, bool& filter)
{
  WqlConverter converter;
  converter.parse(pattern);
  filter = converter.flt_;
  DBGLOG("WqlConverter \"%s\" to \"%s\" filter=%d", pattern.c_str(), converter.wql_.c_str(), filter);
  return converter.wql_;
}

void WqlConverter::literal(int c)
{
  switch (c)
  {
    case '%':
      wql_.append("[%]");
      break;
    case '_':
      wql_.append("[_]");
      break;
    case '[':
      wql_.append("[[]");
      break;
    default:
      utf8_encode(c, wql_);
  }
}

void WqlConverter::any_sequence()
{
  wql_.push_back('%');
}

void WqlConverter::any_one()
{
  wql_.push_back('_');
}

void WqlConverter::end_bracket()
{
  // LIKE [...] lists are not portable, match any one character and filter later
  wql_.push_back('_');
  flt_ = true;
}

} // namespace wildcard
