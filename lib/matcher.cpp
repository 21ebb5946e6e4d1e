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
@file      matcher.cpp
@brief     wildcard pattern matcher engine
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <wildcard/matcher.h>
#include <wildcard/parser.h>
#include <wildcard/debug.h>
#include <wildcard/utf8.h>
#include <algorithm>

namespace wildcard {

/// Compiles a wildcard pattern to the elements and sets of a matcher.
class Matcher::Compiler : public Parser {
 public:
  Compiler(Matcher& matcher)
    :
      mat_(matcher)
  { }
 protected:
  virtual void literal(int c)
  {
    mat_.elm_.push_back(Element(Element::LITERAL, mat_.nrm_(c)));
  }
  virtual void any_sequence()
  {
    // ** is the same as *
    if (mat_.elm_.empty() || mat_.elm_.back().kind != Element::ANY_SEQUENCE)
      mat_.elm_.push_back(Element(Element::ANY_SEQUENCE));
  }
  virtual void any_one()
  {
    mat_.elm_.push_back(Element(Element::ANY_ONE));
  }
  virtual void begin_bracket()
  {
    mat_.set_.push_back(Ranges<int>());
  }
  virtual void bracket_literal(int c)
  {
    mat_.set_.back().insert(mat_.nrm_(c));
  }
  virtual void bracket_range(int lo, int hi)
  {
    DBGCHK(lo <= hi);
    // ranges are kept as written, member() tests both cases of a normalized character
    mat_.set_.back().insert(lo, hi);
  }
  virtual void end_bracket()
  {
    mat_.elm_.push_back(Element(Element::BRACKET, static_cast<int>(mat_.set_.size() - 1)));
  }
 private:
  Matcher& mat_;
};

const size_t Matcher::State::NPOS;

void Matcher::State::reserve(size_t len)
{
  if (cur_.stamp.size() <= len)
  {
    cur_.stamp.resize(len + 1);
    nxt_.stamp.resize(len + 1);
    cur_.stack.reserve(len);
    nxt_.stack.reserve(len);
  }
}

void Matcher::State::reset(size_t len)
{
  reserve(len);
  std::fill(cur_.stamp.begin(), cur_.stamp.begin() + len + 1, NPOS);
  std::fill(nxt_.stamp.begin(), nxt_.stamp.begin() + len + 1, NPOS);
  cur_.stack.clear();
  nxt_.stack.clear();
}

// add pattern position p to the frontier at text position pos, the end position len is stamped but not stacked
static inline void add(Matcher::State::Frontier& frontier, size_t p, size_t pos, size_t len)
{
  if (frontier.stamp[p] == pos)
    return;
  frontier.stamp[p] = pos;
  if (p < len)
    frontier.stack.push_back(p);
}

Matcher::Matcher(const std::string& pattern, option_type options, const std::locale& locale)
  :
    nrm_(options, locale)
{
  Compiler compiler(*this);
  compiler.parse(pattern, options);
  DBGLOG("Matcher compiled \"%s\" to %zu elements and %zu sets", pattern.c_str(), elm_.size(), set_.size());
}

bool Matcher::match(const char *text, size_t size, State& state) const
{
  size_t len = elm_.size();
  state.reset(len);

  State::Frontier *cur = &state.cur_;
  State::Frontier *nxt = &state.nxt_;
  size_t pos = 0;

  add(*cur, 0, pos, len);

  const char *s = text;
  const char *e = text + size;

  while (s < e)
  {
    // no position left to advance from, but text remains
    if (cur->stack.empty())
      return false;

    int c = nrm_(utf8_decode(s, e));

    DBGLOGN("%zu: U+%04X with %zu positions", pos, c, cur->stack.size());

    while (!cur->stack.empty())
    {
      size_t p = cur->stack.back();
      cur->stack.pop_back();
      const Element& elm = elm_[p];
      switch (elm.kind)
      {
        case Element::ANY_SEQUENCE:
          add(*cur, p + 1, pos, len);
          add(*nxt, p, pos + 1, len);
          break;
        case Element::ANY_ONE:
          add(*nxt, p + 1, pos + 1, len);
          break;
        case Element::LITERAL:
          if (elm.arg == c)
            add(*nxt, p + 1, pos + 1, len);
          break;
        case Element::BRACKET:
          if (member(set_[elm.arg], c))
            add(*nxt, p + 1, pos + 1, len);
          break;
      }
    }

    std::swap(cur, nxt);
    ++pos;
  }

  // trailing * match the empty remainder of the text
  while (!cur->stack.empty())
  {
    size_t p = cur->stack.back();
    cur->stack.pop_back();
    if (elm_[p].kind == Element::ANY_SEQUENCE)
      add(*cur, p + 1, pos, len);
  }

  return cur->stamp[len] == pos;
}

} // namespace wildcard
