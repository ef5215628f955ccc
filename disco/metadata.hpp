// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__METADATA__HPP__
#define __DISCO__METADATA__HPP__ 1

// document level key/value record.
// iteration lists the preferred keys first (id, document, author, creation-date, last-modifier,
// last-modification-date), then the remaining keys in insertion order.

#include <string>
#include <vector>
#include <utility>
#include <iostream>

namespace disco
{
  class Metadata
  {
  public:
    typedef std::string key_type;
    typedef std::string mapped_type;
    typedef std::string data_type;
    typedef std::pair<key_type, mapped_type> value_type;

  private:
    typedef std::vector<value_type, std::allocator<value_type> > value_set_type;

  public:
    typedef value_set_type::size_type       size_type;
    typedef value_set_type::difference_type difference_type;

    typedef value_set_type::const_iterator const_iterator;
    typedef value_set_type::const_iterator iterator;

  public:
    Metadata() : __values() {}

  public:
    // the preferred keys, nul terminated
    static const char** preferred();

    void set(const key_type& key, const mapped_type& value);

    const_iterator find(const key_type& key) const;
    bool has(const key_type& key) const { return find(key) != end(); }

    // empty string when missing
    const mapped_type& get(const key_type& key) const;

    void erase(const key_type& key);

    const_iterator begin() const { return __values.begin(); }
    const_iterator end() const { return __values.end(); }

    size_type size() const { return __values.size(); }
    bool empty() const { return __values.empty(); }

    void clear() { __values.clear(); }
    void swap(Metadata& x) { __values.swap(x.__values); }

  public:
    // one "# key = value" line per entry
    friend
    std::ostream& operator<<(std::ostream& os, const Metadata& x);

    friend
    bool operator==(const Metadata& x, const Metadata& y) { return x.__values == y.__values; }
    friend
    bool operator!=(const Metadata& x, const Metadata& y) { return x.__values != y.__values; }

  private:
    value_set_type __values;
  };
};

namespace std
{
  inline
  void swap(disco::Metadata& x, disco::Metadata& y)
  {
    x.swap(y);
  }
};

#endif
