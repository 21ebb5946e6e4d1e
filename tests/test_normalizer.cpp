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
@file      test_normalizer.cpp
@brief     tests of wildcard character normalization
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/normalizer.h>
#include <gtest/gtest.h>
#include <locale>

using wildcard::Normalizer;
namespace option = wildcard::option;

TEST(NormalizerTest, Identity)
{
  Normalizer normalizer;
  EXPECT_FALSE(normalizer.icase());
  EXPECT_EQ('A', normalizer('A'));
  EXPECT_EQ(0xC4, normalizer(0xC4));
  EXPECT_EQ('a', normalizer.upper('a'));
  Normalizer invariant(option::culture_invariant);
  EXPECT_EQ('A', invariant('A'));
}

TEST(NormalizerTest, Locale)
{
  Normalizer normalizer(option::ignore_case, std::locale::classic());
  EXPECT_TRUE(normalizer.icase());
  EXPECT_FALSE(normalizer.invariant());
  EXPECT_EQ('a', normalizer('A'));
  EXPECT_EQ('a', normalizer('a'));
  EXPECT_EQ('A', normalizer.upper('a'));
  EXPECT_EQ('1', normalizer('1'));
  EXPECT_EQ(0x200000, normalizer(0x200000));
}

TEST(NormalizerTest, LocaleNonAscii)
{
  Normalizer normalizer(option::ignore_case, std::locale::classic());
  EXPECT_EQ(0xE4, normalizer(0xC4));         // Ä
  EXPECT_EQ(0xE9, normalizer(0xE9));         // é
  EXPECT_EQ(0xC9, normalizer.upper(0xE9));   // É
  EXPECT_EQ(0x3C3, normalizer(0x3A3));       // Σ
  EXPECT_EQ(0x410, normalizer.upper(0x430)); // А
  EXPECT_EQ(0xDF, normalizer(0xDF));         // ß
}

TEST(NormalizerTest, Invariant)
{
  Normalizer normalizer(option::ignore_case | option::culture_invariant);
  EXPECT_TRUE(normalizer.invariant());
  EXPECT_EQ('z', normalizer('Z'));
  EXPECT_EQ(0xE4, normalizer(0xC4));   // Ä
  EXPECT_EQ(0xFE, normalizer(0xDE));   // Þ
  EXPECT_EQ(0xD7, normalizer(0xD7));   // ×
  EXPECT_EQ(0xDF, normalizer(0xDF));   // ß
  EXPECT_EQ(0x101, normalizer(0x100)); // Ā
  EXPECT_EQ(0x101, normalizer(0x101));
  EXPECT_EQ(0x13A, normalizer(0x139)); // Ĺ
  EXPECT_EQ(0x149, normalizer(0x149)); // ŉ
  EXPECT_EQ(0xFF, normalizer(0x178));  // Ÿ
  EXPECT_EQ(0x17E, normalizer(0x17D)); // Ž
  EXPECT_EQ(0x130, normalizer(0x130)); // İ
  EXPECT_EQ(0x3AC, normalizer(0x386)); // Ά
  EXPECT_EQ(0x3B1, normalizer(0x391)); // Α
  EXPECT_EQ(0x3C3, normalizer(0x3A3)); // Σ
  EXPECT_EQ(0x430, normalizer(0x410)); // А
  EXPECT_EQ(0x451, normalizer(0x401)); // Ё
  EXPECT_EQ(0x561, normalizer(0x531)); // Ա
  EXPECT_EQ(0x1E01, normalizer(0x1E00));
  EXPECT_EQ(0x1E9E, normalizer(0x1E9E));
  EXPECT_EQ(0xFF41, normalizer(0xFF21)); // Ａ
}

TEST(NormalizerTest, InvariantUpper)
{
  Normalizer normalizer(option::ignore_case | option::culture_invariant);
  EXPECT_EQ('Q', normalizer.upper('q'));
  EXPECT_EQ(0xC4, normalizer.upper(0xE4));
  EXPECT_EQ(0x178, normalizer.upper(0xFF));
  EXPECT_EQ(0x3A3, normalizer.upper(0x3C3));
  EXPECT_EQ(0x3C2, normalizer.upper(0x3C2)); // final sigma
  EXPECT_EQ(0x401, normalizer.upper(0x451));
  EXPECT_EQ(0xDF, normalizer.upper(0xDF));
}

TEST(NormalizerTest, InvariantRoundTrip)
{
  for (int c = 0; c < 0x2000; ++c)
  {
    int lower = Normalizer::lower(c);
    if (lower != c)
    {
      EXPECT_EQ(c, Normalizer::upper_invariant(lower)) << std::hex << c;
      EXPECT_EQ(lower, Normalizer::lower(lower)) << std::hex << c;
    }
  }
}
