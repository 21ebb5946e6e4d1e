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
@file      normalizer.cpp
@brief     wildcard character normalization for case-insensitive matching
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/normalizer.h>

namespace wildcard {

// upper case letters [lo,hi] spaced step apart map to lower case letters by adding delta
static const struct Fold {
  int lo;
  int hi;
  int delta;
  int step;
} folds[] = {
  { 0x0041, 0x005A,    32, 1 }, // Basic Latin
  { 0x00C0, 0x00D6,    32, 1 }, // Latin-1
  { 0x00D8, 0x00DE,    32, 1 },
  { 0x0100, 0x012F,     1, 2 }, // Latin Extended-A
  { 0x0132, 0x0137,     1, 2 },
  { 0x0139, 0x0148,     1, 2 },
  { 0x014A, 0x0177,     1, 2 },
  { 0x0178, 0x0178,  -121, 1 }, // Y with diaeresis
  { 0x0179, 0x017E,     1, 2 },
  { 0x0386, 0x0386,    38, 1 }, // Greek
  { 0x0388, 0x038A,    37, 1 },
  { 0x038C, 0x038C,    64, 1 },
  { 0x038E, 0x038F,    63, 1 },
  { 0x0391, 0x03A1,    32, 1 },
  { 0x03A3, 0x03AB,    32, 1 },
  { 0x0400, 0x040F,    80, 1 }, // Cyrillic
  { 0x0410, 0x042F,    32, 1 },
  { 0x0460, 0x0481,     1, 2 },
  { 0x048A, 0x04BF,     1, 2 },
  { 0x04D0, 0x052F,     1, 2 },
  { 0x0531, 0x0556,    48, 1 }, // Armenian
  { 0x1E00, 0x1E95,     1, 2 }, // Latin Extended Additional
  { 0x1EA0, 0x1EFF,     1, 2 },
  { 0xFF21, 0xFF3A,    32, 1 }, // fullwidth Latin
};

static const size_t nfolds = sizeof(folds)/sizeof(folds[0]);

Normalizer::Normalizer(option_type options, const std::locale& locale)
  :
    icase_((options & option::ignore_case) != 0),
    invariant_((options & option::culture_invariant) != 0),
    loc_(locale),
    ctype_(&std::use_facet< std::ctype<wchar_t> >(loc_))
{ }

int Normalizer::lower(int c)
{
  if (c < 0x80)
    return c >= 'A' && c <= 'Z' ? c + 32 : c;
  for (size_t i = 1; i < nfolds; ++i)
  {
    const Fold& f = folds[i];
    if (c < f.lo)
      break;
    if (c <= f.hi && (c - f.lo) % f.step == 0)
      return c + f.delta;
  }
  return c;
}

int Normalizer::upper_invariant(int c)
{
  if (c < 0x80)
    return c >= 'a' && c <= 'z' ? c - 32 : c;
  // lower case images are not ordered, search all
  for (size_t i = 1; i < nfolds; ++i)
  {
    const Fold& f = folds[i];
    int lo = f.lo + f.delta;
    int hi = f.hi + f.delta;
    if (c >= lo && c <= hi && (c - lo) % f.step == 0)
      return c - f.delta;
  }
  return c;
}

int Normalizer::to_lower(int c) const
{
  if (c < 0 || c > 0x10FFFF)
    return c;
  int l = static_cast<int>(ctype_->tolower(static_cast<wchar_t>(c)));
  // letters the locale does not fold take the locale-independent mapping
  return l != c ? l : lower(c);
}

int Normalizer::to_upper(int c) const
{
  if (c < 0 || c > 0x10FFFF)
    return c;
  int u = static_cast<int>(ctype_->toupper(static_cast<wchar_t>(c)));
  return u != c ? u : upper_invariant(c);
}

} // namespace wildcard
