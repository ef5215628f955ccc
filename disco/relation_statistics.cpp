//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <algorithm>

#include <boost/spirit/include/qi.hpp>
#include <boost/fusion/tuple.hpp>
#include <boost/filesystem/operations.hpp>

#include "relation_statistics.hpp"

#include "utils/compress_stream.hpp"

namespace disco
{
  const RelationStatistics::label_set_type& RelationStatistics::patterns()
  {
    static const char* __names[] = {"NN", "NS", "SN"};
    static const label_set_type __patterns(__names, __names + 3);

    return __patterns;
  }

  void RelationStatistics::add(const label_type& relation, const pattern_type& pattern, const count_type& count)
  {
    const label_set_type& pats = patterns();

    label_set_type::const_iterator piter = std::find(pats.begin(), pats.end(), pattern);
    if (piter == pats.end())
      throw std::runtime_error("invalid nuclearity pattern: " + pattern);

    count_set_type& counts_relation = counts[relation];
    counts_relation.resize(pats.size(), 0);

    counts_relation[piter - pats.begin()] += count;
  }

  void RelationStatistics::collect(const tree_type& tree, const nuclearity_set_type& nuclearity)
  {
    if (nuclearity.size() != tree.size())
      throw std::runtime_error("nuclearity does not match the tree size");

    tree.verify();

    for (tree_type::size_type i = 1; i != tree.size(); ++ i) {
      const tree_type::index_type head = tree.heads[i];

      // the edge into the fake root has no pattern
      if (head <= 0) continue;

      if (nuclearity[i].is_nucleus())
	add(tree.labels[i], "NN");
      else if (nuclearity[i].is_satellite())
	add(tree.labels[i], tree.units[i] < tree.units[head] ? "SN" : "NS");
    }
  }

  RelationStatistics::count_type RelationStatistics::count(const label_type& relation, const pattern_type& pattern) const
  {
    const label_set_type& pats = patterns();

    count_map_type::const_iterator citer = counts.find(relation);
    if (citer == counts.end()) return 0;

    label_set_type::const_iterator piter = std::find(pats.begin(), pats.end(), pattern);
    if (piter == pats.end()) return 0;

    return citer->second[piter - pats.begin()];
  }

  RelationStatistics::pattern_type RelationStatistics::most_frequent(const label_type& relation) const
  {
    count_map_type::const_iterator citer = counts.find(relation);
    if (citer == counts.end())
      return pattern_type();

    // the first maximum wins
    count_set_type::const_iterator miter = std::max_element(citer->second.begin(), citer->second.end());

    return patterns()[miter - citer->second.begin()];
  }

  RelationStatistics::label_set_type RelationStatistics::multinuclear() const
  {
    label_set_type labels;

    for (count_map_type::const_iterator citer = counts.begin(); citer != counts.end(); ++ citer)
      if (most_frequent(citer->first) == "NN")
	labels.push_back(citer->first);

    return labels;
  }

  void RelationStatistics::read(const path_type& path)
  {
    if (path != "-" && ! boost::filesystem::exists(path))
      throw std::runtime_error("no relation statistics file? " + path.string());

    utils::compress_istream is(path);
    is >> *this;

    if (is.bad())
      throw std::runtime_error("failed to read relation statistics: " + path.string());
  }

  std::ostream& operator<<(std::ostream& os, const RelationStatistics& x)
  {
    const RelationStatistics::label_set_type& pats = RelationStatistics::patterns();

    for (RelationStatistics::const_iterator citer = x.begin(); citer != x.end(); ++ citer)
      for (size_t i = 0; i != pats.size(); ++ i)
	if (citer->second[i] > 0)
	  os << citer->first << ' ' << pats[i] << ' ' << citer->second[i] << '\n';

    return os;
  }

  std::istream& operator>>(std::istream& is, RelationStatistics& x)
  {
    typedef boost::fusion::tuple<std::string, std::string, double> parsed_type;

    namespace qi = boost::spirit::qi;
    namespace standard = boost::spirit::standard;

    qi::rule<std::string::const_iterator, std::string(), standard::space_type> token;
    token %= qi::lexeme[+(standard::char_ - standard::space)];

    std::string line;

    while (std::getline(is, line)) {
      const std::string::size_type pos = line.find_first_not_of(" \t\r");
      if (pos == std::string::npos || line[pos] == '#') continue;

      parsed_type parsed;

      std::string::const_iterator iter = line.begin();
      std::string::const_iterator end  = line.end();

      const bool result = qi::phrase_parse(iter, end, token >> token >> qi::double_, standard::space, parsed);
      if (! result || iter != end)
	throw std::runtime_error("invalid relation statistics: " + line);

      x.add(boost::fusion::get<0>(parsed), boost::fusion::get<1>(parsed), boost::fusion::get<2>(parsed));
    }

    // stop at the end of stream
    is.clear(is.rdstate() & ~std::ios_base::failbit);

    return is;
  }
};
