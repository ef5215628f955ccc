// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__NUCLEARITY__HPP__
#define __DISCO__NUCLEARITY__HPP__ 1

#include <string>
#include <iostream>

namespace disco
{
  struct Nuclearity
  {
    typedef enum {
      none = 0,
      nucleus,
      satellite,
      root,
    } value_type;

    Nuclearity() : value(none) {}
    Nuclearity(const value_type& __value) : value(__value) {}
    explicit Nuclearity(const std::string& x) { assign(x); }

    void assign(const std::string& x);

    bool empty() const { return value == none; }

    bool is_nucleus() const { return value == nucleus; }
    bool is_satellite() const { return value == satellite; }
    bool is_root() const { return value == root; }

    // N, S, R or _
    char code() const;
    const char* name() const;

    operator value_type() const { return value; }

    friend
    std::ostream& operator<<(std::ostream& os, const Nuclearity& x);
    friend
    std::istream& operator>>(std::istream& is, Nuclearity& x);

    value_type value;
  };
};

#endif
