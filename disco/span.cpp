//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <iterator>
#include <stdexcept>

#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/karma.hpp>

#include <boost/fusion/include/adapt_struct.hpp>

#include "span.hpp"

BOOST_FUSION_ADAPT_STRUCT(
			  disco::Span,
			  (disco::Span::index_type, first)
			  (disco::Span::index_type, last)
			  )

namespace disco
{
  bool Span::assign(std::string::const_iterator& iter, std::string::const_iterator end)
  {
    namespace qi = boost::spirit::qi;
    namespace standard = boost::spirit::standard;

    qi::int_parser<index_type> int_;

    return qi::phrase_parse(iter, end, qi::lexeme[int_ >> ".." >> int_], standard::space, *this);
  }

  void Span::assign(const std::string& x)
  {
    std::string::const_iterator iter(x.begin());
    std::string::const_iterator end(x.end());

    const bool result = assign(iter, end);
    if (! result || iter != end)
      throw std::runtime_error("invalid span format? " + x);

    if (last < first)
      throw std::runtime_error("invalid span: " + x);
  }

  std::istream& operator>>(std::istream& is, Span& x)
  {
    std::string span;

    if (is >> span)
      x.assign(span);
    else
      x = Span();

    return is;
  }

  std::ostream& operator<<(std::ostream& os, const Span& x)
  {
    typedef std::ostream_iterator<char> iterator_type;

    namespace karma = boost::spirit::karma;

    iterator_type iter(os);

    karma::int_generator<Span::index_type> int_;

    if (! karma::generate(iter, int_ << ".." << int_, x.first, x.last))
      throw std::runtime_error("span generation failed...?");

    return os;
  }
};
