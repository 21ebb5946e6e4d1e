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
@file      test_pattern.cpp
@brief     tests of wildcard patterns
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/pattern.h>
#include <gtest/gtest.h>
#include <locale>
#include <stdexcept>
#include <string>

using wildcard::Pattern;
namespace option = wildcard::option;

TEST(PatternTest, StarMatchesEverything)
{
  Pattern pattern("*");
  EXPECT_TRUE(pattern.match_all());
  EXPECT_TRUE(pattern.match(""));
  EXPECT_TRUE(pattern.match("anything at all"));
  EXPECT_TRUE(pattern.match(std::string("\xff\xfe")));
  EXPECT_TRUE(Pattern("*", option::ignore_case).match("X"));
}

TEST(PatternTest, EmptyPattern)
{
  Pattern pattern("");
  EXPECT_FALSE(pattern.match_all());
  EXPECT_TRUE(pattern.match(""));
  EXPECT_FALSE(pattern.match("x"));
}

TEST(PatternTest, Literals)
{
  EXPECT_TRUE(Pattern("abc").match("abc"));
  EXPECT_FALSE(Pattern("abc").match("ABC"));
  EXPECT_TRUE(Pattern("abc", option::ignore_case).match("ABC"));
  EXPECT_FALSE(Pattern("abc").match("abcd"));
  EXPECT_FALSE(Pattern("abc").match("ab"));
}

TEST(PatternTest, QuestionMark)
{
  Pattern pattern("a?c");
  EXPECT_TRUE(pattern.match("abc"));
  EXPECT_FALSE(pattern.match("ac"));
  EXPECT_FALSE(pattern.match("abbc"));
}

TEST(PatternTest, Asterisk)
{
  Pattern pattern("a*c");
  EXPECT_TRUE(pattern.match("aXXXc"));
  EXPECT_TRUE(pattern.match("ac"));
  EXPECT_FALSE(pattern.match("a"));
}

TEST(PatternTest, BracketRanges)
{
  Pattern pattern("[a-c]at");
  EXPECT_TRUE(pattern.match("bat"));
  EXPECT_FALSE(pattern.match("dat"));
  EXPECT_THROW(Pattern("[z-a]"), wildcard::pattern_error);
}

TEST(PatternTest, BracketMembers)
{
  Pattern close("[]a]");
  EXPECT_TRUE(close.match("]"));
  EXPECT_TRUE(close.match("a"));
  EXPECT_FALSE(close.match("b"));
  Pattern dash("[a-]");
  EXPECT_TRUE(dash.match("-"));
  EXPECT_TRUE(dash.match("a"));
  EXPECT_FALSE(dash.match("b"));
  Pattern literal("[*]");
  EXPECT_TRUE(literal.match("*"));
  EXPECT_FALSE(literal.match("x"));
}

TEST(PatternTest, UnterminatedBrackets)
{
  EXPECT_THROW(Pattern("["), wildcard::pattern_error);
  EXPECT_THROW(Pattern("a[bc"), wildcard::pattern_error);
}

TEST(PatternTest, Escapes)
{
  Pattern only(std::string("`"));
  EXPECT_TRUE(only.match(""));
  EXPECT_FALSE(only.match("`"));
  Pattern trailing("a`");
  EXPECT_TRUE(trailing.match("a`"));
  EXPECT_FALSE(trailing.match("a"));
  Pattern star("a`*");
  EXPECT_TRUE(star.match("a*"));
  EXPECT_FALSE(star.match("ab"));
  Pattern brackets("`[x`]");
  EXPECT_TRUE(brackets.match("[x]"));
  EXPECT_FALSE(brackets.match("x"));
}

TEST(PatternTest, CommandNames)
{
  Pattern pattern("Get-*", option::ignore_case);
  EXPECT_TRUE(pattern.match("get-childitem"));
  EXPECT_TRUE(pattern.match("GET-HELP"));
  EXPECT_FALSE(pattern.match("Set-Item"));
}

TEST(PatternTest, CultureInvariant)
{
  Pattern pattern("straße-ÄÖÜ", option::ignore_case | option::culture_invariant);
  EXPECT_TRUE(pattern.match("STRAßE-äöü"));
  EXPECT_FALSE(pattern.match("STRASSE-äöü"));
}

TEST(PatternTest, Locale)
{
  Pattern pattern("ABC", option::ignore_case, std::locale::classic());
  EXPECT_TRUE(pattern.match("abc"));
}

TEST(PatternTest, CultureNonAscii)
{
  Pattern pattern("ÄÖÜ", option::ignore_case);
  EXPECT_TRUE(pattern.match("äöü"));
  EXPECT_TRUE(pattern.match("ÄöÜ"));
  EXPECT_FALSE(pattern.match("aou"));
  EXPECT_TRUE(Pattern("É", option::ignore_case).match("é"));
  EXPECT_TRUE(Pattern("Ж*", option::ignore_case).match("жук"));
}

TEST(PatternTest, CultureNonAsciiBracket)
{
  Pattern pattern("[À-Þ]", option::ignore_case);
  EXPECT_TRUE(pattern.match("é"));
  EXPECT_TRUE(pattern.match("É"));
  EXPECT_FALSE(pattern.match("ß"));
  EXPECT_FALSE(Pattern("[À-Þ]").match("é"));
}

TEST(PatternTest, NullArguments)
{
  EXPECT_THROW(Pattern(static_cast<const char*>(NULL)), std::invalid_argument);
  EXPECT_FALSE(Pattern("*").match(static_cast<const char*>(NULL)));
  EXPECT_FALSE(Pattern("a").match(static_cast<const char*>(NULL)));
}

TEST(PatternTest, Accessors)
{
  Pattern pattern("a*", option::ignore_case | option::compiled);
  EXPECT_EQ("a*", pattern.str());
  EXPECT_EQ(option::ignore_case | option::compiled, pattern.options());
}

TEST(PatternTest, SharedMatchAll)
{
  std::shared_ptr<const Pattern> all = Pattern::get("*");
  EXPECT_EQ(all.get(), Pattern::get("*", option::ignore_case).get());
  EXPECT_TRUE(all->match_all());
  std::shared_ptr<const Pattern> one = Pattern::get("a?", option::ignore_case);
  EXPECT_NE(one.get(), Pattern::get("a?", option::ignore_case).get());
  EXPECT_TRUE(one->match("AB"));
}

TEST(PatternTest, SharedState)
{
  Pattern pattern("*.txt");
  wildcard::Matcher::State state;
  EXPECT_TRUE(pattern.match("notes.txt", state));
  EXPECT_FALSE(pattern.match("notes.txt.gz", state));
  EXPECT_TRUE(pattern.match(".txt", state));
}
