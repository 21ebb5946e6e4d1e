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
@file      pattern.h
@brief     wildcard pattern
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

A wildcard::Pattern holds a wildcard pattern, its options and its compiled
matcher.  Patterns are immutable and may be shared among threads.

Example:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    #include <wildcard/pattern.h>

    try
    {
      wildcard::Pattern pattern("*.[ch]pp", wildcard::option::ignore_case);
      if (pattern.match("Main.CPP"))
        std::cout << "matches " << pattern.regex_string() << std::endl;
    }
    catch (const wildcard::pattern_error& e)
    {
      std::cerr << e.what();
    }
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

Output:

    matches \.[ch]pp$
*/

#ifndef WILDCARD_PATTERN_H
#define WILDCARD_PATTERN_H

#include <wildcard/error.h>
#include <wildcard/matcher.h>
#include <wildcard/options.h>
#include <boost/regex.hpp>
#include <locale>
#include <memory>
#include <string>

namespace wildcard {

/// Wildcard pattern with options and compiled matcher.
class Pattern {
 public:
  /// Construct and compile a UTF-8 wildcard pattern, throws pattern_error or std::invalid_argument when pattern is NULL.
  explicit Pattern(
      const char *pattern,
      option_type options = option::none);
  /// Construct and compile a UTF-8 wildcard pattern, throws pattern_error.
  explicit Pattern(
      const std::string& pattern,
      option_type        options = option::none);
  /// Construct and compile a UTF-8 wildcard pattern that folds case with the given locale, throws pattern_error.
  Pattern(
      const std::string& pattern,
      option_type        options,
      const std::locale& locale);
  /// Returns a shared pattern, the shared match-all pattern when pattern is `*`.
  static std::shared_ptr<const Pattern> get(
      const std::string& pattern,
      option_type        options = option::none);
  /// Returns true if the pattern matches the entire UTF-8 text, false when text is NULL.
  bool match(const char *text) const;
  /// Returns true if the pattern matches the entire UTF-8 text.
  bool match(const std::string& text) const
  {
    return !mat_ || mat_->match(text);
  }
  /// Returns true if the pattern matches the entire UTF-8 text, using the scratch space of the calling thread.
  bool match(const std::string& text, Matcher::State& state) const
  {
    return !mat_ || mat_->match(text, state);
  }
  /// Returns the wildcard pattern string.
  const std::string& str() const
  {
    return pat_;
  }
  /// Returns the options.
  option_type options() const
  {
    return opt_;
  }
  /// Returns true if this pattern matches any text.
  bool match_all() const
  {
    return !mat_;
  }
  /// Returns the regex rendering of this pattern.
  std::string regex_string() const;
  /// Returns the regex rendering of this pattern compiled by Boost.Regex for boost::regex_search, throws pattern_error.
  boost::regex regex() const;
  /// Returns the DOS wildcard rendering of this pattern, where bracket expressions become `?`.
  std::string dos_string() const;
  /// Returns the WQL LIKE operand of this pattern, throws conversion_error when the pattern has a bracket expression.
  std::string wql() const;
  /// Returns the pattern with the wildcard characters `*`, `?`, `[` and `]` escaped by a backtick, except for those listed, throws std::invalid_argument when an argument is NULL.
  static std::string escape(
      const char *pattern,
      const char *chars_not_to_escape = "");
  /// Returns the pattern with the wildcard characters `*`, `?`, `[` and `]` escaped by a backtick, except for those listed.
  static std::string escape(
      const std::string& pattern,
      const std::string& chars_not_to_escape = std::string())
  {
    return escape(pattern.c_str(), chars_not_to_escape.c_str());
  }
  /// Returns the pattern with escaped wildcard characters and double backticks unescaped, throws std::invalid_argument when pattern is NULL.
  static std::string unescape(const char *pattern);
  /// Returns the pattern with escaped wildcard characters and double backticks unescaped.
  static std::string unescape(const std::string& pattern)
  {
    return unescape(pattern.c_str());
  }
  /// Returns true if the pattern has an unescaped `*`, `?` or `[`.
  static bool has_wildcards(const char *pattern);
  /// Returns true if the pattern has an unescaped `*`, `?` or `[`.
  static bool has_wildcards(const std::string& pattern)
  {
    return has_wildcards(pattern.c_str());
  }
 private:
  void init(const std::locale& locale);
  std::string                    pat_; ///< wildcard pattern string
  option_type                    opt_; ///< options
  std::shared_ptr<const Matcher> mat_; ///< compiled matcher, NULL when the pattern is `*`
};

} // namespace wildcard

#endif
