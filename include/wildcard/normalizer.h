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
@file      normalizer.h
@brief     wildcard character normalization for case-insensitive matching
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef WILDCARD_NORMALIZER_H
#define WILDCARD_NORMALIZER_H

#include <wildcard/options.h>
#include <locale>

namespace wildcard {

/// Character normalizer decided once from the options: identity, locale-specific lower case, or locale-independent lower case.
///
/// Locale-specific folding applies the ctype facet of the locale first and the
/// locale-independent mapping to characters the facet leaves unchanged, so
/// the two differ only where the locale maps a letter differently.
class Normalizer {
 public:
  /// Construct a normalizer for the given options, using the locale for case-insensitive matching unless option::culture_invariant is set.
  explicit Normalizer(
      option_type        options = option::none,
      const std::locale& locale = std::locale());
  /// Returns the normalized (lower case) character c, or c when case is not ignored.
  int operator()(int c) const
  {
    if (!icase_)
      return c;
    return invariant_ ? lower(c) : to_lower(c);
  }
  /// Returns the upper case counterpart of c when case is ignored, or c otherwise.
  int upper(int c) const
  {
    if (!icase_)
      return c;
    return invariant_ ? upper_invariant(c) : to_upper(c);
  }
  /// Returns true if this normalizer folds case.
  bool icase() const
  {
    return icase_;
  }
  /// Returns true if this normalizer ignores the locale.
  bool invariant() const
  {
    return invariant_;
  }
  /// Locale-independent simple lower case mapping of Latin, Greek, Cyrillic, Armenian and fullwidth Latin letters.
  static int lower(int c);
  /// Locale-independent simple upper case mapping, the inverse of lower().
  static int upper_invariant(int c);
 private:
  int to_lower(int c) const;
  int to_upper(int c) const;
  bool                          icase_;     ///< fold case
  bool                          invariant_; ///< ignore locale
  std::locale                   loc_;       ///< locale to fold case with, owns ctype_
  const std::ctype<wchar_t>    *ctype_;     ///< ctype facet of loc_
};

} // namespace wildcard

#endif
