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
@file      test_matcher.cpp
@brief     tests of the wildcard matcher engine
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/matcher.h>
#include <wildcard/error.h>
#include <gtest/gtest.h>
#include <string>

using wildcard::Matcher;

TEST(MatcherTest, CompiledElements)
{
  Matcher matcher("a**b?[xy]");
  ASSERT_EQ(5u, matcher.size());
  EXPECT_EQ(Matcher::Element::LITERAL, matcher.elements()[0].kind);
  EXPECT_EQ('a', matcher.elements()[0].arg);
  EXPECT_EQ(Matcher::Element::ANY_SEQUENCE, matcher.elements()[1].kind);
  EXPECT_EQ(Matcher::Element::LITERAL, matcher.elements()[2].kind);
  EXPECT_EQ(Matcher::Element::ANY_ONE, matcher.elements()[3].kind);
  EXPECT_EQ(Matcher::Element::BRACKET, matcher.elements()[4].kind);
  ASSERT_EQ(1u, matcher.sets().size());
  EXPECT_EQ(1u, matcher.sets()[0].size());
  EXPECT_TRUE(matcher.sets()[0].contains('x'));
  EXPECT_TRUE(matcher.sets()[0].contains('y'));
}

TEST(MatcherTest, EmptyPattern)
{
  Matcher matcher("");
  EXPECT_EQ(0u, matcher.size());
  EXPECT_TRUE(matcher.match(""));
  EXPECT_FALSE(matcher.match("x"));
}

TEST(MatcherTest, AnySequence)
{
  Matcher matcher("a*c");
  EXPECT_TRUE(matcher.match("aXXXc"));
  EXPECT_TRUE(matcher.match("ac"));
  EXPECT_TRUE(matcher.match("acc"));
  EXPECT_TRUE(matcher.match("acbc"));
  EXPECT_FALSE(matcher.match("a"));
  EXPECT_FALSE(matcher.match("acb"));
  EXPECT_FALSE(matcher.match("bac"));
}

TEST(MatcherTest, TrailingAnySequences)
{
  Matcher matcher("a**");
  EXPECT_TRUE(matcher.match("a"));
  EXPECT_TRUE(matcher.match("abc"));
  EXPECT_FALSE(matcher.match(""));
  Matcher star("*?*");
  EXPECT_FALSE(star.match(""));
  EXPECT_TRUE(star.match("x"));
  EXPECT_TRUE(star.match("xyz"));
}

TEST(MatcherTest, AnyOne)
{
  Matcher matcher("a?c");
  EXPECT_TRUE(matcher.match("abc"));
  EXPECT_FALSE(matcher.match("ac"));
  EXPECT_FALSE(matcher.match("abbc"));
}

TEST(MatcherTest, Utf8Text)
{
  Matcher one("?");
  EXPECT_TRUE(one.match("é"));
  EXPECT_TRUE(one.match("\xe2\x82\xac")); // euro sign
  EXPECT_FALSE(one.match("ab"));
  Matcher two("??");
  EXPECT_FALSE(two.match("é"));
  EXPECT_TRUE(two.match("éa"));
  Matcher literal("caf?");
  EXPECT_TRUE(literal.match("café"));
  Matcher range("[à-ï]");
  EXPECT_TRUE(range.match("é"));
  EXPECT_FALSE(range.match("e"));
}

TEST(MatcherTest, InvalidUtf8Text)
{
  Matcher matcher("a?b");
  EXPECT_TRUE(matcher.match(std::string("a\xff" "b")));
  EXPECT_FALSE(matcher.match(std::string("a\xc3")));
  Matcher bytes("??");
  EXPECT_TRUE(bytes.match(std::string("\xc3\x28")));
}

TEST(MatcherTest, TextWithNul)
{
  Matcher matcher("a?b");
  EXPECT_TRUE(matcher.match(std::string("a\0b", 3)));
}

TEST(MatcherTest, IgnoreCaseBrackets)
{
  Matcher matcher("[A-C]x", wildcard::option::ignore_case);
  EXPECT_TRUE(matcher.match("bX"));
  EXPECT_TRUE(matcher.match("Bx"));
  EXPECT_FALSE(matcher.match("dx"));
  Matcher lower("[a-c]", wildcard::option::ignore_case);
  EXPECT_TRUE(lower.match("B"));
  Matcher list("[XYZ]", wildcard::option::ignore_case);
  EXPECT_TRUE(list.match("y"));
  Matcher exact("[A-C]x");
  EXPECT_FALSE(exact.match("bx"));
}

TEST(MatcherTest, CultureInvariant)
{
  Matcher matcher("ÄÖÜ*", wildcard::option::ignore_case | wildcard::option::culture_invariant);
  EXPECT_TRUE(matcher.match("äöü"));
  EXPECT_TRUE(matcher.match("ÄöÜber"));
  Matcher greek("[Α-Ω]", wildcard::option::ignore_case | wildcard::option::culture_invariant);
  EXPECT_TRUE(greek.match("λ"));
  Matcher exact("ÄÖÜ", wildcard::option::culture_invariant);
  EXPECT_FALSE(exact.match("äöü"));
}

TEST(MatcherTest, ReusedState)
{
  Matcher matcher("*.[ch]");
  Matcher::State state(matcher);
  const char *names[] = { "main.c", "main.cpp", "x.h", ".c", "c", "a.b.h", "" };
  for (size_t i = 0; i < sizeof(names)/sizeof(*names); ++i)
    EXPECT_EQ(matcher.match(names[i]), matcher.match(names[i], state)) << names[i];
  Matcher longer("*a*b*c*d*e*f*");
  EXPECT_TRUE(longer.match("abcdef", state));
  EXPECT_TRUE(matcher.match("z.c", state));
  EXPECT_FALSE(matcher.match("z.cc", state));
}

TEST(MatcherTest, PathologicalPattern)
{
  Matcher matcher("*a*a*a*a*a*a*a*a*a*a*a*a*a*a*a*a*b");
  std::string text(20000, 'a');
  EXPECT_FALSE(matcher.match(text));
  text.push_back('b');
  EXPECT_TRUE(matcher.match(text));
}

TEST(MatcherTest, InvalidPatterns)
{
  EXPECT_THROW(Matcher("[z-a]"), wildcard::pattern_error);
  EXPECT_THROW(Matcher("abc["), wildcard::pattern_error);
}
