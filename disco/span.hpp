// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__SPAN__HPP__
#define __DISCO__SPAN__HPP__ 1

// half-open character span [first, last)

#include <stdint.h>

#include <string>
#include <utility>
#include <algorithm>
#include <iostream>

namespace disco
{
  struct Span
  {
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    typedef int32_t   index_type;

    Span() : first(0), last(0) {}
    Span(const index_type& __first, const index_type& __last) : first(__first), last(__last) {}
    Span(const std::string& x) { assign(x); }

    void assign(const std::string& x);
    bool assign(std::string::const_iterator& iter, std::string::const_iterator end);

  public:
    bool empty() const { return first == last; }
    difference_type size() const { return last - first; }

    // do we share at least one character?
    bool overlaps(const Span& x) const
    {
      return first < x.last && x.first < last;
    }

    Span merge(const Span& x) const
    {
      return Span(std::min(first, x.first), std::max(last, x.last));
    }

    void swap(Span& x)
    {
      std::swap(first, x.first);
      std::swap(last,  x.last);
    }

  public:
    friend
    std::istream& operator>>(std::istream& is, Span& x);
    friend
    std::ostream& operator<<(std::ostream& os, const Span& x);

  public:
    index_type first;
    index_type last;
  };

  inline
  bool operator==(const Span& x, const Span& y)
  {
    return x.first == y.first && x.last == y.last;
  }

  inline
  bool operator!=(const Span& x, const Span& y)
  {
    return x.first != y.first || x.last != y.last;
  }

  inline
  bool operator<(const Span& x, const Span& y)
  {
    return x.first < y.first || (! (y.first < x.first) && x.last < y.last);
  }

  inline
  bool operator>(const Span& x, const Span& y) { return y < x; }

  inline
  bool operator<=(const Span& x, const Span& y) { return ! (y < x); }

  inline
  bool operator>=(const Span& x, const Span& y) { return ! (x < y); }
};

namespace std
{
  inline
  void swap(disco::Span& x, disco::Span& y)
  {
    x.swap(y);
  }
};

#endif
