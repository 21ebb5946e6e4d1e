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
@file      error.cpp
@brief     wildcard pattern syntax and conversion errors
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/error.h>
#include <cstring>

namespace wildcard {

const pattern_error_type pattern_error::mismatched_brackets;
const pattern_error_type pattern_error::invalid_class_range;
const pattern_error_type pattern_error::invalid_regex;

std::string pattern_error::pattern_error_message(pattern_error_type code, const std::string& pattern, size_t pos)
{
  static const char *messages[] = {
    "mismatched [ ]",
    "invalid character class range",
    "invalid regex",
  };
  const char *message = code >= 0 && code < static_cast<pattern_error_type>(sizeof(messages)/sizeof(*messages)) ? messages[code] : "invalid pattern";
  size_t len = pattern.size();
  if (pos > len)
    pos = len;
  // show a window of up to 60 bytes of the pattern that contains pos, starting at a UTF-8 lead byte
  size_t from = pos < 40 ? 0 : pos - 20;
  while (from > 0 && (pattern[from] & 0xc0) == 0x80)
    --from;
  size_t upto = from + 60;
  if (upto > len)
    upto = len;
  while (upto < len && (pattern[upto] & 0xc0) == 0x80)
    ++upto;
  size_t col = displen(pattern.c_str() + from, pos - from);
  size_t l = strlen(message);
  std::string what("invalid wildcard pattern at position ");
  what.append(ztoa(pos)).append("\n").append(pattern, from, upto - from).append("\n");
  if (col >= l + 4)
    what.append(col - l - 4, ' ').append(message).append("___/\n");
  else
    what.append(col, ' ').append("\\___").append(message).append("\n");
  return what;
}

// number of display columns of the first k bytes of s, counting one column per UTF-8 sequence
size_t pattern_error::displen(const char *s, size_t k)
{
  size_t n = 0;
  for (size_t i = 0; i < k && s[i] != '\0'; ++i)
    if ((s[i] & 0xc0) != 0x80)
      ++n;
  return n;
}

std::string conversion_error::conversion_error_message(const std::string& pattern, const char *target)
{
  std::string what("cannot convert wildcard pattern \"");
  what.append(pattern).append("\" to ").append(target != NULL ? target : "the target language").append(" without filtering on the client side");
  return what;
}

} // namespace wildcard
