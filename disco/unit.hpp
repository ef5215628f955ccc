// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__UNIT__HPP__
#define __DISCO__UNIT__HPP__ 1

// elementary discourse unit

#include <disco/span.hpp>

namespace disco
{
  struct Unit
  {
    typedef Span::index_type index_type;
    typedef Span             span_type;

    Unit() : index(-1), span() {}
    Unit(const index_type& __index, const span_type& __span) : index(__index), span(__span) {}

    bool fake() const { return index < 0; }

    index_type index;
    span_type  span;
  };

  inline
  bool operator==(const Unit& x, const Unit& y)
  {
    return x.index == y.index && x.span == y.span;
  }

  inline
  bool operator!=(const Unit& x, const Unit& y)
  {
    return x.index != y.index || x.span != y.span;
  }

  // units are ordered by their position in the text
  inline
  bool operator<(const Unit& x, const Unit& y)
  {
    return x.span < y.span || (! (y.span < x.span) && x.index < y.index);
  }
};

#endif
