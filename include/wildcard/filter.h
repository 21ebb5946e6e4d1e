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
@file      filter.h
@brief     wildcard include and exclude pattern sets
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

A text is accepted by a filter when it matches one of the include patterns,
or when there are no include patterns, and it matches none of the exclude
patterns.

Example:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    wildcard::Filter filter(wildcard::option::ignore_case);
    filter.include("*.cpp");
    filter.include("*.h");
    filter.exclude("test_*");
    filter.accept("Main.CPP");     // true
    filter.accept("test_main.cpp"); // false
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/

#ifndef WILDCARD_FILTER_H
#define WILDCARD_FILTER_H

#include <wildcard/pattern.h>
#include <memory>
#include <string>
#include <vector>

namespace wildcard {

/// Set of wildcard patterns that share the same options.
class PatternSet {
 public:
  typedef std::vector< std::shared_ptr<const Pattern> > Patterns;
  typedef Patterns::const_iterator const_iterator;
  explicit PatternSet(option_type options = option::none)
    :
      opt_(options)
  { }
  /// Compile and add a pattern to the set, throws pattern_error.
  void insert(const std::string& pattern);
  /// Returns true if the text matches any of the patterns, or default_value when the set is empty.
  bool any(
      const std::string& text,
      bool               default_value)
    const;
  size_t size() const
  {
    return pat_.size();
  }
  bool empty() const
  {
    return pat_.empty();
  }
  const_iterator begin() const
  {
    return pat_.begin();
  }
  const_iterator end() const
  {
    return pat_.end();
  }
  option_type options() const
  {
    return opt_;
  }
 private:
  option_type opt_; ///< options of the patterns
  Patterns    pat_; ///< compiled patterns
};

/// Include and exclude pattern sets.
class Filter {
 public:
  explicit Filter(option_type options = option::none)
    :
      inc_(options),
      exc_(options)
  { }
  /// Add an include pattern, throws pattern_error.
  void include(const std::string& pattern)
  {
    inc_.insert(pattern);
  }
  /// Add an exclude pattern, throws pattern_error.
  void exclude(const std::string& pattern)
  {
    exc_.insert(pattern);
  }
  /// Returns true if text matches an include pattern, or there are none, and text matches no exclude pattern.
  bool accept(const std::string& text) const;
  const PatternSet& includes() const
  {
    return inc_;
  }
  const PatternSet& excludes() const
  {
    return exc_;
  }
 private:
  PatternSet inc_; ///< include patterns
  PatternSet exc_; ///< exclude patterns
};

} // namespace wildcard

#endif
