//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <algorithm>
#include <sstream>

#include <boost/spirit/include/qi.hpp>
#include <boost/fusion/include/adapt_struct.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "dependency_tree.hpp"
#include "error.hpp"

namespace disco
{
  namespace impl
  {
    struct node_parsed_type
    {
      typedef std::vector<std::string, std::allocator<std::string> > token_set_type;

      int            node;
      std::string    span;
      int            head;
      token_set_type tokens;
    };
  };
};

BOOST_FUSION_ADAPT_STRUCT(
			  disco::impl::node_parsed_type,
			  (int, node)
			  (std::string, span)
			  (int, head)
			  (disco::impl::node_parsed_type::token_set_type, tokens)
			  )

namespace disco
{
  namespace impl
  {
    template <typename Iterator>
    struct node_parser : boost::spirit::qi::grammar<Iterator, node_parsed_type(), boost::spirit::standard::space_type>
    {
      node_parser() : node_parser::base_type(node)
      {
	namespace qi = boost::spirit::qi;
	namespace standard = boost::spirit::standard;

	token %= qi::lexeme[+(standard::char_ - standard::space)];
	node  %= qi::int_ >> token >> qi::int_ >> +token;
      }

      typedef boost::spirit::standard::space_type space_type;

      boost::spirit::qi::rule<Iterator, std::string(), space_type>      token;
      boost::spirit::qi::rule<Iterator, node_parsed_type(), space_type> node;
    };

    inline
    bool blank(const std::string& line)
    {
      return line.find_first_not_of(" \t\r") == std::string::npos;
    }
  };

  const DependencyTree::label_type& DependencyTree::root_label()
  {
    static const label_type __label("ROOT");
    return __label;
  }

  void DependencyTree::clear()
  {
    units.clear();
    heads.clear();
    labels.clear();
    nuclearity.clear();
    sentences.clear();
    ranks.clear();
    metadata.clear();

    // fake root
    units.push_back(unit_type());
    heads.push_back(-1);
    labels.push_back(root_label());
    nuclearity.push_back(nuclearity_type(nuclearity_type::root));
  }

  DependencyTree::index_type DependencyTree::add(const unit_type& unit,
						 const index_type head,
						 const label_type& label,
						 const nuclearity_type& nuc)
  {
    if (! sentences.empty())
      throw std::runtime_error("sentence id is missing for a node of a tree with sentences");

    ranks.clear();

    units.push_back(unit);
    heads.push_back(head);
    labels.push_back(label);
    nuclearity.push_back(nuc);

    return heads.size() - 1;
  }

  DependencyTree::index_type DependencyTree::add(const unit_type& unit,
						 const index_type head,
						 const label_type& label,
						 const nuclearity_type& nuc,
						 const index_type sentence)
  {
    if (sentences.empty() && heads.size() == 1)
      sentences.push_back(-1);

    if (sentences.size() != heads.size())
      throw std::runtime_error("sentence id given for a node of a tree without sentences");

    ranks.clear();

    units.push_back(unit);
    heads.push_back(head);
    labels.push_back(label);
    nuclearity.push_back(nuc);
    sentences.push_back(sentence);

    return heads.size() - 1;
  }

  bool DependencyTree::has_nuclearity() const
  {
    for (size_type i = 1; i < nuclearity.size(); ++ i)
      if (nuclearity[i].empty())
	return false;
    return nuclearity.size() == heads.size();
  }

  DependencyTree::index_set_type DependencyTree::real_roots() const
  {
    index_set_type roots;
    for (size_type i = 1; i < heads.size(); ++ i)
      if (heads[i] == 0)
	roots.push_back(i);
    return roots;
  }

  struct less_rank
  {
    less_rank(const DependencyTree::rank_set_type& __ranks) : ranks(__ranks) {}

    bool operator()(const DependencyTree::index_type& x, const DependencyTree::index_type& y) const
    {
      return ranks[x] < ranks[y];
    }

    const DependencyTree::rank_set_type& ranks;
  };

  void DependencyTree::dependents(const index_type head, index_set_type& deps) const
  {
    deps.clear();

    for (size_type i = 1; i < heads.size(); ++ i)
      if (heads[i] == head)
	deps.push_back(i);

    if (has_ranks())
      std::stable_sort(deps.begin(), deps.end(), less_rank(ranks));
  }

  void DependencyTree::dependents(dependent_map_type& deps) const
  {
    deps.clear();
    deps.resize(heads.size());

    for (size_type i = 1; i < heads.size(); ++ i)
      if (heads[i] >= 0 && heads[i] < index_type(heads.size()))
	deps[heads[i]].push_back(i);

    if (has_ranks())
      for (dependent_map_type::iterator diter = deps.begin(); diter != deps.end(); ++ diter)
	std::stable_sort(diter->begin(), diter->end(), less_rank(ranks));
  }

  void DependencyTree::verify() const
  {
    const index_type num_nodes = heads.size();

    if (units.size() != heads.size() || labels.size() != heads.size() || nuclearity.size() != heads.size())
      throw structural_error("inconsistent number of units, heads, labels and nuclearity");

    for (index_type i = 1; i != num_nodes; ++ i) {
      if (heads[i] < 0 || heads[i] >= num_nodes)
	throw structural_error("head out of range for node " + boost::lexical_cast<std::string>(i)
			       + ": " + boost::lexical_cast<std::string>(heads[i]), i);
      if (heads[i] == i)
	throw structural_error("node " + boost::lexical_cast<std::string>(i) + " is its own head", i);
    }

    // 0: unvisited, 1: on the current path, 2: reaches the fake root
    std::vector<char, std::allocator<char> > state(num_nodes, 0);
    index_set_type path;

    state[0] = 2;
    for (index_type i = 1; i != num_nodes; ++ i) {
      path.clear();

      index_type node = i;
      while (state[node] == 0) {
	state[node] = 1;
	path.push_back(node);
	node = heads[node];
      }

      if (state[node] == 1)
	throw structural_error("cycle through node " + boost::lexical_cast<std::string>(node), node);

      for (index_set_type::const_iterator piter = path.begin(); piter != path.end(); ++ piter)
	state[*piter] = 2;
    }
  }

  std::ostream& operator<<(std::ostream& os, const DependencyTree& x)
  {
    os << x.metadata;

    const bool has_sentences = x.has_sentences();

    for (DependencyTree::size_type i = 1; i < x.heads.size(); ++ i) {
      os << i
	 << ' ' << x.units[i].span
	 << ' ' << x.heads[i]
	 << ' ' << x.labels[i]
	 << ' ' << x.nuclearity[i];
      if (has_sentences)
	os << ' ' << x.sentences[i];
      os << '\n';
    }

    return os;
  }

  std::istream& operator>>(std::istream& is, DependencyTree& x)
  {
    typedef impl::node_parser<std::string::const_iterator> parser_type;

    namespace qi = boost::spirit::qi;
    namespace standard = boost::spirit::standard;

    x.clear();

    parser_type parser;
    impl::node_parsed_type parsed;

    std::string line;
    bool found = false;
    bool sentence_mode = false;

    while (std::getline(is, line)) {
      if (impl::blank(line)) {
	if (found) break;
	continue;
      }

      std::string::size_type pos = line.find_first_not_of(" \t");
      if (line[pos] == '#') {
	if (found)
	  throw std::runtime_error("metadata after nodes: " + line);

	const std::string::size_type sep = line.find('=', pos);
	if (sep == std::string::npos)
	  throw std::runtime_error("invalid metadata: " + line);

	const std::string key   = boost::algorithm::trim_copy(line.substr(pos + 1, sep - pos - 1));
	const std::string value = boost::algorithm::trim_copy(line.substr(sep + 1));

	if (key.empty())
	  throw std::runtime_error("invalid metadata: " + line);

	x.metadata.set(key, value);
	continue;
      }

      parsed = impl::node_parsed_type();

      std::string::const_iterator iter = line.begin();
      std::string::const_iterator end  = line.end();

      const bool result = qi::phrase_parse(iter, end, parser, standard::space, parsed);
      if (! result || iter != end)
	throw std::runtime_error("invalid dependency line: " + line);

      if (parsed.node != int(x.heads.size()))
	throw std::runtime_error("node out of order: " + line);

      if (parsed.tokens.size() > 3)
	throw std::runtime_error("too many columns: " + line);

      const bool has_sentence = (parsed.tokens.size() == 3);

      if (! found)
	sentence_mode = has_sentence;
      else if (sentence_mode != has_sentence)
	throw std::runtime_error("sentence column is given to some nodes only: " + line);

      const Unit unit(parsed.node - 1, Span(parsed.span));
      const Nuclearity nuc(parsed.tokens.size() > 1 ? Nuclearity(parsed.tokens[1]) : Nuclearity());

      if (has_sentence) {
	int sentence = 0;
	try {
	  sentence = boost::lexical_cast<int>(parsed.tokens[2]);
	}
	catch (boost::bad_lexical_cast&) {
	  throw std::runtime_error("invalid sentence id: " + line);
	}

	x.add(unit, parsed.head, parsed.tokens[0], nuc, sentence);
      } else
	x.add(unit, parsed.head, parsed.tokens[0], nuc);

      found = true;
    }

    // a block without any node is not a tree
    if (! found) {
      x.clear();
      is.setstate(std::ios_base::failbit);
    } else
      is.clear(is.rdstate() & ~std::ios_base::failbit);

    return is;
  }
};
