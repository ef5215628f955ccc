//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>

#include "nuclearity.hpp"

namespace disco
{
  void Nuclearity::assign(const std::string& x)
  {
    namespace algo = boost::algorithm;

    if (x == "_" || x.empty())
      value = none;
    else if (x == "N" || algo::iequals(x, "nucleus"))
      value = nucleus;
    else if (x == "S" || algo::iequals(x, "satellite"))
      value = satellite;
    else if (x == "R" || algo::iequals(x, "root"))
      value = root;
    else
      throw std::runtime_error("invalid nuclearity: " + x);
  }

  char Nuclearity::code() const
  {
    switch (value) {
    case nucleus:   return 'N';
    case satellite: return 'S';
    case root:      return 'R';
    default:        return '_';
    }
  }

  const char* Nuclearity::name() const
  {
    switch (value) {
    case nucleus:   return "Nucleus";
    case satellite: return "Satellite";
    case root:      return "Root";
    default:        return "none";
    }
  }

  std::ostream& operator<<(std::ostream& os, const Nuclearity& x)
  {
    os << x.code();
    return os;
  }

  std::istream& operator>>(std::istream& is, Nuclearity& x)
  {
    std::string token;

    if (is >> token)
      x.assign(token);
    else
      x = Nuclearity();

    return is;
  }
};
