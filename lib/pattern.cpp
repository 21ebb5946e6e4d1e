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
@file      pattern.cpp
@brief     wildcard pattern
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/pattern.h>
#include <wildcard/convert.h>
#include <wildcard/debug.h>
#include <cstring>
#include <stdexcept>

namespace wildcard {

static const char *null_check(const char *arg, const char *name)
{
  if (arg == NULL)
    throw std::invalid_argument(std::string("wildcard: argument ").append(name).append(" is NULL"));
  return arg;
}

static inline bool is_wildcard(char c)
{
  return c == '*' || c == '?' || c == '[' || c == ']';
}

Pattern::Pattern(const char *pattern, option_type options)
  :
    pat_(null_check(pattern, "pattern")),
    opt_(options)
{
  init(std::locale());
}

Pattern::Pattern(const std::string& pattern, option_type options)
  :
    pat_(pattern),
    opt_(options)
{
  init(std::locale());
}

Pattern::Pattern(const std::string& pattern, option_type options, const std::locale& locale)
  :
    pat_(pattern),
    opt_(options)
{
  init(locale);
}

void Pattern::init(const std::locale& locale)
{
  // * matches anything, no need to compile
  if (pat_ == "*")
    return;
  mat_ = std::make_shared<Matcher>(pat_, opt_, locale);
}

std::shared_ptr<const Pattern> Pattern::get(const std::string& pattern, option_type options)
{
  if (pattern == "*")
  {
    static const std::shared_ptr<const Pattern> all(std::make_shared<Pattern>("*"));
    DBGLOG("Pattern::get(\"*\") shared match-all pattern");
    return all;
  }
  return std::make_shared<Pattern>(pattern, options);
}

bool Pattern::match(const char *text) const
{
  if (text == NULL)
    return false;
  if (!mat_)
    return true;
  Matcher::State state;
  return mat_->match(text, std::strlen(text), state);
}

std::string Pattern::regex_string() const
{
  return RegexConverter::convert(pat_);
}

boost::regex Pattern::regex() const
{
  std::string rex = regex_string();
  boost::regex::flag_type flags = boost::regex::perl | boost::regex::mod_s | boost::regex::no_mod_m;
  if ((opt_ & option::ignore_case))
    flags |= boost::regex::icase;
  try
  {
    return boost::regex(rex, flags);
  }
  catch (const boost::regex_error& e)
  {
    DBGLOG("Boost.Regex rejected \"%s\": %s", rex.c_str(), e.what());
    throw pattern_error(pattern_error::invalid_regex, pat_);
  }
}

std::string Pattern::dos_string() const
{
  return DosConverter::convert(pat_);
}

std::string Pattern::wql() const
{
  bool filter = false;
  std::string wql = WqlConverter::convert(pat_, filter);
  if (filter)
    throw conversion_error(pat_, "WQL");
  return wql;
}

std::string Pattern::escape(const char *pattern, const char *chars_not_to_escape)
{
  null_check(pattern, "pattern");
  null_check(chars_not_to_escape, "chars_not_to_escape");
  std::string s;
  s.reserve(2 * std::strlen(pattern));
  for (const char *p = pattern; *p != '\0'; ++p)
  {
    if (is_wildcard(*p) && std::strchr(chars_not_to_escape, *p) == NULL)
      s.push_back(Parser::Const::ESC);
    s.push_back(*p);
  }
  return s;
}

std::string Pattern::unescape(const char *pattern)
{
  null_check(pattern, "pattern");
  std::string s;
  s.reserve(std::strlen(pattern));
  bool escaped = false;
  for (const char *p = pattern; *p != '\0'; ++p)
  {
    if (*p == Parser::Const::ESC)
    {
      // `` is one `
      if (escaped)
        s.push_back(*p);
      escaped = !escaped;
      continue;
    }
    if (escaped && !is_wildcard(*p))
      s.push_back(Parser::Const::ESC);
    s.push_back(*p);
    escaped = false;
  }
  if (escaped)
    s.push_back(Parser::Const::ESC);
  return s;
}

bool Pattern::has_wildcards(const char *pattern)
{
  if (pattern == NULL)
    return false;
  for (const char *p = pattern; *p != '\0'; ++p)
  {
    if (*p == '*' || *p == '?' || *p == '[')
      return true;
    if (*p == Parser::Const::ESC && *++p == '\0')
      break;
  }
  return false;
}

} // namespace wildcard
