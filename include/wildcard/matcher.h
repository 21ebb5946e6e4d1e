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
@file      matcher.h
@brief     wildcard pattern matcher engine
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

A wildcard pattern is compiled to a sequence of elements, one per literal,
`?`, `*` and bracket expression.  Matching simulates the nondeterministic
automaton of the sequence over the text, keeping the set of pattern positions
reachable after each text character.  The time taken is O(M*N) for a pattern
of M elements and a text of N characters, whatever the number of `*`.

Example:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    wildcard::Matcher matcher("*.[ch]", wildcard::option::ignore_case);
    wildcard::Matcher::State state(matcher);
    for (const std::string& name : names)
      if (matcher.match(name, state))
        std::cout << name << std::endl;
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/

#ifndef WILDCARD_MATCHER_H
#define WILDCARD_MATCHER_H

#include <wildcard/normalizer.h>
#include <wildcard/options.h>
#include <wildcard/ranges.h>
#include <locale>
#include <string>
#include <vector>

namespace wildcard {

/// Wildcard pattern matcher engine, immutable after construction and safe to share among threads.
class Matcher {
 public:
  /// Compiled pattern element.
  struct Element {
    /// Kind of element.
    enum Kind {
      LITERAL,      ///< a literal character
      ANY_ONE,      ///< `?`
      ANY_SEQUENCE, ///< `*`
      BRACKET       ///< bracket expression
    };
    Element(Kind kind, int arg = 0)
      :
        kind(kind),
        arg(arg)
    { }
    Kind kind; ///< kind of element
    int  arg;  ///< normalized character of a LITERAL or index of the set of a BRACKET
  };
  typedef std::vector<Element>    Elements;
  typedef std::vector<Ranges<int> > Sets;
  /// Reusable scratch space for match(), one per thread.
  class State {
    friend class Matcher;
   public:
    /// Set of positions in the pattern, members are stamped with the text position at which they were added.
    struct Frontier {
      std::vector<size_t> stamp; ///< stamp[p] is the text position at which pattern position p was added, or NPOS
      std::vector<size_t> stack; ///< positions to process, excludes the end position
    };
    static const size_t NPOS = static_cast<size_t>(-1);
    State()
    { }
    /// Construct scratch space sized for the given matcher.
    explicit State(const Matcher& matcher)
    {
      reserve(matcher.size());
    }
   private:
    /// Grow and reset the frontiers for a pattern of len elements.
    void reset(size_t len);
    void reserve(size_t len);
    Frontier cur_; ///< positions reachable before the current text character
    Frontier nxt_; ///< positions reachable after the current text character
  };
  /// Compile a UTF-8 wildcard pattern, throws pattern_error.
  explicit Matcher(
      const std::string& pattern,                    ///< wildcard pattern
      option_type        options = option::none,     ///< option flags
      const std::locale& locale = std::locale());    ///< locale to fold case with
  /// Returns true if the pattern matches the entire UTF-8 text.
  bool match(const std::string& text) const
  {
    State state;
    return match(text.data(), text.size(), state);
  }
  /// Returns true if the pattern matches the entire UTF-8 text, reusing the given scratch space.
  bool match(const std::string& text, State& state) const
  {
    return match(text.data(), text.size(), state);
  }
  /// Returns true if the pattern matches the entire UTF-8 text of the given length in bytes.
  bool match(
      const char *text,   ///< UTF-8 text, not necessarily 0-terminated
      size_t      size,   ///< length of the text in bytes
      State&      state)  ///< scratch space
    const;
  /// Returns the number of elements of the compiled pattern.
  size_t size() const
  {
    return elm_.size();
  }
  /// Returns the compiled elements.
  const Elements& elements() const
  {
    return elm_;
  }
  /// Returns the compiled bracket expression sets.
  const Sets& sets() const
  {
    return set_;
  }
 private:
  class Compiler;
  /// Returns true if normalized character c is a member of bracket expression set s.
  bool member(const Ranges<int>& s, int c) const
  {
    return s.contains(c) || (nrm_.icase() && s.contains(nrm_.upper(c)));
  }
  Normalizer nrm_; ///< normalizer of pattern and text characters
  Elements   elm_; ///< compiled elements
  Sets       set_; ///< bracket expression sets
};

} // namespace wildcard

#endif
