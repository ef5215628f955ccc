//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <vector>
#include <utility>

#include <boost/spirit/include/qi.hpp>
#include <boost/fusion/include/std_pair.hpp>

#include "parameter.hpp"
#include "error.hpp"

namespace disco
{
  Parameter::Parameter(const std::string& parameter, const char* const* keys)
    : __name(), __values()
  {
    typedef std::pair<std::string, std::string>                               key_value_type;
    typedef std::vector<key_value_type, std::allocator<key_value_type> >      key_value_set_type;
    typedef std::pair<std::string, key_value_set_type>                        parsed_type;
    typedef std::string::const_iterator                                       iterator_type;
    typedef boost::spirit::standard::space_type                               space_type;

    namespace qi = boost::spirit::qi;
    namespace standard = boost::spirit::standard;

    qi::rule<iterator_type, std::string(), space_type>        name;
    qi::rule<iterator_type, std::string(), space_type>        key;
    qi::rule<iterator_type, std::string(), space_type>        value;
    qi::rule<iterator_type, key_value_set_type(), space_type> key_values;

    name  %= qi::lexeme[+(standard::char_ - standard::space - ':')];
    key   %= qi::lexeme[+(standard::char_ - standard::space - '=' - ',')];
    value %= qi::lexeme[+(standard::char_ - standard::space - ',')];
    key_values %= (key >> '=' >> value) % ',';

    parsed_type parsed;

    iterator_type iter = parameter.begin();
    iterator_type end  = parameter.end();

    const bool result = qi::phrase_parse(iter, end,
					 name >> -(':' >> key_values),
					 standard::space,
					 parsed);

    if (! result || iter != end)
      throw configuration_error("invalid strategy parameter: " + parameter);

    __name.swap(parsed.first);

    for (key_value_set_type::const_iterator kiter = parsed.second.begin(); kiter != parsed.second.end(); ++ kiter) {
      bool known = false;
      for (const char* const* kptr = keys; kptr && *kptr && ! known; ++ kptr)
	known = (kiter->first == *kptr);

      if (! known)
	throw configuration_error("unknown key for " + __name + ": " + kiter->first);

      if (! __values.insert(*kiter).second)
	throw configuration_error("key given twice for " + __name + ": " + kiter->first);
    }
  }

  const Parameter::mapped_type& Parameter::get(const key_type& key) const
  {
    static const mapped_type __empty;

    value_map_type::const_iterator iter = __values.find(key);
    return (iter != __values.end() ? iter->second : __empty);
  }
};
