// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__PARAMETER__HPP__
#define __DISCO__PARAMETER__HPP__ 1

// strategy string: name[:key=value[,key=value]*]

#include <string>
#include <map>

namespace disco
{
  class Parameter
  {
  public:
    typedef std::string key_type;
    typedef std::string mapped_type;

  private:
    typedef std::map<key_type, mapped_type, std::less<key_type>,
		     std::allocator<std::pair<const key_type, mapped_type> > > value_map_type;

  public:
    // keys is a nul terminated list of the accepted keys, or 0 when none is accepted.
    // configuration_error for a malformed string, an unknown key or a key given twice.
    Parameter(const std::string& parameter, const char* const* keys = 0);

  public:
    const std::string& name() const { return __name; }

    bool has(const key_type& key) const { return __values.find(key) != __values.end(); }

    // empty when not given
    const mapped_type& get(const key_type& key) const;

  private:
    std::string    __name;
    value_map_type __values;
  };
};

#endif
