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
@file      ranges.h
@brief     wildcard sets of disjoint closed ranges of code points
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

A bracket expression `[a-cx0-9]` is compiled to a set of ranges [lo,hi].
Ranges are stored in a `std::set` ordered by their bounds, where overlapping
and adjacent ranges are merged on insertion, so that each value is covered by
at most one range and a membership test takes O(log N) time for N ranges.

Example:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    wildcard::Ranges<int> set;
    set.insert('a', 'c');
    set.insert('x');
    set.insert('d', 'f'); // merged with [a,c] into [a,f]
    if (set.contains('e'))
      std::cout << "e is in " << set.size() << " ranges" << std::endl;
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

Output:

    e is in 2 ranges
*/

#ifndef WILDCARD_RANGES_H
#define WILDCARD_RANGES_H

#include <limits>
#include <set>
#include <utility>

namespace wildcard {

/// Functor to define a total order on disjoint ranges, two ranges compare equal when they overlap.
template<typename T>
struct range_compare {
  bool operator()(
      const std::pair<T,T>& lhs, ///< LHS range to compare
      const std::pair<T,T>& rhs) ///< RHS range to compare
    const
    /// @returns true if lhs lies entirely before rhs.
  {
    return lhs.second < rhs.first;
  }
};

/// Set of disjoint closed ranges [lo,hi] of integral values, stored in a std::set base class container.
template<typename T>
class Ranges : public std::set< std::pair<T,T>,range_compare<T> > {
 public:
  /// Type of the bounds.
  typedef T bound_type;
  /// Synonym type defining the base class container std::set.
  typedef typename std::set< std::pair<T,T>,range_compare<T> > container_type;
  /// Synonym type defining the base class container std::set::value_type.
  typedef typename container_type::value_type value_type;
  /// Synonym type defining the base class container std::set::iterator.
  typedef typename container_type::iterator iterator;
  /// Synonym type defining the base class container std::set::const_iterator.
  typedef typename container_type::const_iterator const_iterator;
  /// Construct an empty set of ranges.
  Ranges()
  { }
  /// Construct a set with one range [lo,hi].
  Ranges(
      const bound_type& lo, ///< lower bound
      const bound_type& hi) ///< upper bound
  {
    insert(lo, hi);
  }
  /// Update ranges to include range [lo,hi], merging it with overlapping and adjacent ranges.
  iterator insert(
      const bound_type& lo, ///< lower bound, lo <= hi
      const bound_type& hi) ///< upper bound
    /// @returns iterator to the range that contains [lo,hi].
  {
    value_type r(lo, hi);
    // widen the search by one on both ends to merge adjacent ranges, without overflowing the bounds
    value_type key(lo, hi);
    if (key.first > std::numeric_limits<T>::min())
      --key.first;
    if (key.second < std::numeric_limits<T>::max())
      ++key.second;
    iterator i = container_type::lower_bound(key);
    while (i != container_type::end() && !(key.second < i->first))
    {
      if (i->first < r.first)
        r.first = i->first;
      if (r.second < i->second)
        r.second = i->second;
      container_type::erase(i++);
    }
    return container_type::insert(i, r);
  }
  /// Update ranges to include the value [val,val].
  iterator insert(const bound_type& val) ///< value to insert
    /// @returns iterator to the range that contains val.
  {
    return insert(val, val);
  }
  /// Find the range [lo,hi] that includes the given value, i.e. lo <= val <= hi.
  const_iterator find(const bound_type& val) ///< value to search for
    const
    /// @returns iterator to the range that includes the value, or the end iterator.
  {
    return container_type::find(value_type(val, val));
  }
  /// Returns true if the given value is in one of the ranges.
  bool contains(const bound_type& val) ///< value to search for
    const
  {
    return find(val) != container_type::end();
  }
  /// Returns true if this set of ranges is not empty.
  bool any()
    const
  {
    return !container_type::empty();
  }
  /// Returns the lowest value in the set of ranges, the set must not be empty.
  bound_type lo()
    const
  {
    return container_type::begin()->first;
  }
  /// Returns the highest value in the set of ranges, the set must not be empty.
  bound_type hi()
    const
  {
    return container_type::rbegin()->second;
  }
};

} // namespace wildcard

#endif
