//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "metadata.hpp"

namespace disco
{
  const char** Metadata::preferred()
  {
    static const char* keys[] = {
      "id",
      "document",
      "author",
      "creation-date",
      "last-modifier",
      "last-modification-date",
      0,
    };
    return keys;
  }

  namespace impl
  {
    // rank of a key: position in the preferred list, or past the end for the others
    inline
    int preference(const std::string& key)
    {
      const char** keys = Metadata::preferred();

      int rank = 0;
      for (/**/; keys[rank]; ++ rank)
	if (key == keys[rank])
	  return rank;
      return rank;
    }
  };

  void Metadata::set(const key_type& key, const mapped_type& value)
  {
    for (value_set_type::iterator iter = __values.begin(); iter != __values.end(); ++ iter)
      if (iter->first == key) {
	iter->second = value;
	return;
      }

    // insert after the last entry with a rank not greater than ours, which keeps preferred keys
    // in their order and the rest in insertion order
    const int rank = impl::preference(key);

    value_set_type::iterator iter = __values.end();
    while (iter != __values.begin() && impl::preference((iter - 1)->first) > rank)
      -- iter;

    __values.insert(iter, value_type(key, value));
  }

  Metadata::const_iterator Metadata::find(const key_type& key) const
  {
    for (const_iterator iter = begin(); iter != end(); ++ iter)
      if (iter->first == key)
	return iter;
    return end();
  }

  const Metadata::mapped_type& Metadata::get(const key_type& key) const
  {
    static const mapped_type __empty;

    const_iterator iter = find(key);
    return (iter != end() ? iter->second : __empty);
  }

  void Metadata::erase(const key_type& key)
  {
    for (value_set_type::iterator iter = __values.begin(); iter != __values.end(); ++ iter)
      if (iter->first == key) {
	__values.erase(iter);
	return;
      }
  }

  std::ostream& operator<<(std::ostream& os, const Metadata& x)
  {
    for (Metadata::const_iterator iter = x.begin(); iter != x.end(); ++ iter)
      os << "# " << iter->first << " = " << iter->second << '\n';
    return os;
  }
};
