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
@file      test_convert.cpp
@brief     tests of wildcard pattern conversions to regex, DOS and WQL
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/convert.h>
#include <wildcard/pattern.h>
#include <boost/regex.hpp>
#include <gtest/gtest.h>
#include <string>

using wildcard::Pattern;

TEST(ConvertTest, RegexAnchors)
{
  EXPECT_EQ("", Pattern("*").regex_string());
  EXPECT_EQ("", Pattern("**").regex_string());
  EXPECT_EQ("^a", Pattern("a*").regex_string());
  EXPECT_EQ("a$", Pattern("*a").regex_string());
  EXPECT_EQ("a", Pattern("*a*").regex_string());
  EXPECT_EQ("^$", Pattern("").regex_string());
  EXPECT_EQ("^a.c$", Pattern("a?c").regex_string());
  EXPECT_EQ("^.$", Pattern("?").regex_string());
}

TEST(ConvertTest, RegexEscapes)
{
  EXPECT_EQ("^a\\.b$", Pattern("a.b").regex_string());
  EXPECT_EQ("^\\(x\\)\\+\\{1\\}$", Pattern("(x)+{1}").regex_string());
  EXPECT_EQ("^\\$\\^\\|$", Pattern("$^|").regex_string());
  EXPECT_EQ("^a\\\\b$", Pattern("a\\b").regex_string());
  EXPECT_EQ("^a]$", Pattern("a]").regex_string());
  EXPECT_EQ("^\\*\\?\\[$", Pattern("`*`?`[").regex_string());
  EXPECT_EQ("^é$", Pattern("é").regex_string());
}

TEST(ConvertTest, RegexBrackets)
{
  EXPECT_EQ("^[a-c]x$", Pattern("[a-c]x").regex_string());
  EXPECT_EQ("^[\\]\\x2d]$", Pattern("[]-]").regex_string());
  EXPECT_EQ("^[[]$", Pattern("[[]").regex_string());
  EXPECT_EQ("^[\\.\\*]$", Pattern("[.*]").regex_string());
  EXPECT_EQ("^[0-9\\x2d]$", Pattern("[0-9-]").regex_string());
}

TEST(ConvertTest, RegexConverter)
{
  EXPECT_EQ("\\.txt$", wildcard::RegexConverter::convert("*.txt"));
  EXPECT_THROW(wildcard::RegexConverter::convert("[a"), wildcard::pattern_error);
}

TEST(ConvertTest, RegexAgreesWithMatcher)
{
  const char *patterns[] = { "a*c", "[a-c]at", "a?c", "*.txt", "x[]y]z", "a.b*", "(1)*", "*[0-9]", "*", "", "[+-]?" };
  const char *texts[] = { "", "ac", "abc", "aXc", "bat", "dat", "notes.txt", "txt", "x]z", "xyz", "a.bcd", "axb", "(1)", "(1)x", "v9", "9", "+1", "-", "1" };
  for (size_t i = 0; i < sizeof(patterns)/sizeof(*patterns); ++i)
  {
    Pattern pattern(patterns[i]);
    boost::regex regex = pattern.regex();
    for (size_t j = 0; j < sizeof(texts)/sizeof(*texts); ++j)
      EXPECT_EQ(pattern.match(texts[j]), boost::regex_search(std::string(texts[j]), regex)) << patterns[i] << " on " << texts[j];
  }
}

TEST(ConvertTest, RegexIgnoreCase)
{
  boost::regex regex = Pattern("ABC*", wildcard::option::ignore_case).regex();
  EXPECT_TRUE(boost::regex_search(std::string("abcdef"), regex));
  EXPECT_FALSE(boost::regex_search(std::string("xabc"), regex));
  boost::regex exact = Pattern("ABC*").regex();
  EXPECT_FALSE(boost::regex_search(std::string("abcdef"), exact));
}

TEST(ConvertTest, DosWildcards)
{
  EXPECT_EQ("a??*", Pattern("a[bc]?*").dos_string());
  EXPECT_EQ("*", Pattern("`*").dos_string());
  EXPECT_EQ("file.txt", Pattern("file.txt").dos_string());
  EXPECT_EQ("?é", wildcard::DosConverter::convert("[a-z]é"));
}

TEST(ConvertTest, Wql)
{
  EXPECT_EQ("a%[_]_", Pattern("a*_?").wql());
  EXPECT_EQ("100[%]", Pattern("100%").wql());
  EXPECT_EQ("[[]x", Pattern("`[x").wql());
  EXPECT_EQ("%", Pattern("*").wql());
  EXPECT_EQ("", Pattern("").wql());
}

TEST(ConvertTest, WqlNeedsFiltering)
{
  try
  {
    Pattern("a*_[b]").wql();
    FAIL() << "expected a conversion_error";
  }
  catch (const wildcard::conversion_error& e)
  {
    EXPECT_EQ("a*_[b]", e.pattern());
    EXPECT_EQ("WQL", e.target());
    EXPECT_STREQ("UnsupportedWildcardToWqlConversion", wildcard::conversion_error::id());
  }
  bool filter = false;
  EXPECT_EQ("a%[_]_", wildcard::WqlConverter::convert("a*_[b]", filter));
  EXPECT_TRUE(filter);
  EXPECT_EQ("a_", wildcard::WqlConverter::convert("a?", filter));
  EXPECT_FALSE(filter);
}
