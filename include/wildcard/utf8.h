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
@file      utf8.h
@brief     wildcard UTF-8 encoding and decoding of code points
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

Patterns and matched strings are UTF-8 encoded.  The parser and the matcher
decode them one code point at a time.  Decoding is bounded by an end pointer,
so strings may contain NUL characters.  Invalid UTF-8 is decoded one byte at
a time to the non-character WILDCARD_NONCHAR, which never equals a valid code
point of a pattern, but matches `?` and `*`.
*/

#ifndef WILDCARD_UTF8_H
#define WILDCARD_UTF8_H

#include <string>

/// Invalid UTF-8 is decoded to the non-character U+200000 that is outside of the Unicode range.
#define WILDCARD_NONCHAR (0x200000)

namespace wildcard {

/// Append the UTF-8 encoding of UCS code point c to string s, appends U+FFFD when c is out of range.
inline void utf8_encode(
    int          c, ///< UCS code point U+0000 to U+10FFFF
    std::string& s) ///< string to append to
{
  if (c < 0 || c > 0x10FFFF)
    c = 0xFFFD;
  if (c < 0x80)
  {
    s.push_back(static_cast<char>(c));
  }
  else if (c < 0x800)
  {
    s.push_back(static_cast<char>(0xC0 | (c >> 6)));
    s.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
  else if (c < 0x10000)
  {
    s.push_back(static_cast<char>(0xE0 | (c >> 12)));
    s.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
  else
  {
    s.push_back(static_cast<char>(0xF0 | (c >> 18)));
    s.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

/// Decode the UTF-8 sequence at s before e and advance s past it, returns WILDCARD_NONCHAR and advances one byte on invalid UTF-8.
inline int utf8_decode(
    const char *& s, ///< points to the UTF-8 sequence to decode, advanced
    const char   *e) ///< end of the string, s < e
  /// @returns UCS code point or WILDCARD_NONCHAR
{
  int c = static_cast<unsigned char>(*s++);
  if (c < 0x80)
    return c;
  // number of continuation bytes and the smallest code point that needs them, to reject overlong forms
  int n, min;
  if (c >= 0xC2 && c < 0xE0)
  {
    n = 1;
    min = 0x80;
    c &= 0x1F;
  }
  else if (c >= 0xE0 && c < 0xF0)
  {
    n = 2;
    min = 0x800;
    c &= 0x0F;
  }
  else if (c >= 0xF0 && c < 0xF5)
  {
    n = 3;
    min = 0x10000;
    c &= 0x07;
  }
  else
  {
    return WILDCARD_NONCHAR;
  }
  if (e - s < n)
    return WILDCARD_NONCHAR;
  const char *t = s;
  for (int i = 0; i < n; ++i)
  {
    int c1 = static_cast<unsigned char>(*t++);
    if ((c1 & 0xC0) != 0x80)
      return WILDCARD_NONCHAR;
    c = (c << 6) | (c1 & 0x3F);
  }
  if (c < min || c > 0x10FFFF)
    return WILDCARD_NONCHAR;
  s = t;
  return c;
}

} // namespace wildcard

#endif
