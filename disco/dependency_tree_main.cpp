//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <sstream>
#include <string>

#include "disco/dependency_tree.hpp"
#include "disco/error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE dependency_tree_test

#include <boost/test/unit_test.hpp>

typedef disco::DependencyTree tree_type;

static const char* document = "\
# author = someone\n\
# source = wsj_0600\n\
# id = d1\n\
1 0..10 2 elaboration S\n\
2 11..20 0 ROOT N\n\
3 21..35 2 joint _\n\
\n\
\n\
1 0..5 0 ROOT N 0\n\
2 6..9 1 attribution S 0\n\
3 10..18 1 contrast S 1\n\
";

BOOST_AUTO_TEST_CASE(read_blocks)
{
  std::istringstream is(document);

  tree_type tree;

  BOOST_CHECK(is >> tree);
  BOOST_CHECK_EQUAL(tree.size(), 4);
  BOOST_CHECK(! tree.has_sentences());
  BOOST_CHECK(! tree.has_ranks());
  BOOST_CHECK(! tree.has_nuclearity());

  BOOST_CHECK(tree.units[0].fake());
  BOOST_CHECK_EQUAL(tree.labels[0], tree_type::root_label());
  BOOST_CHECK(tree.nuclearity[0].is_root());

  BOOST_CHECK_EQUAL(tree.units[1].index, 0);
  BOOST_CHECK_EQUAL(tree.units[1].span, disco::Span(0, 10));
  BOOST_CHECK_EQUAL(tree.units[3].index, 2);
  BOOST_CHECK_EQUAL(tree.units[3].span, disco::Span(21, 35));

  BOOST_CHECK_EQUAL(tree.heads[1], 2);
  BOOST_CHECK_EQUAL(tree.heads[2], 0);
  BOOST_CHECK_EQUAL(tree.labels[3], "joint");
  BOOST_CHECK_EQUAL(tree.nuclearity[1].code(), 'S');
  BOOST_CHECK_EQUAL(tree.nuclearity[2].code(), 'N');
  BOOST_CHECK(tree.nuclearity[3].empty());

  BOOST_CHECK_EQUAL(tree.metadata.get("id"), "d1");
  BOOST_CHECK_EQUAL(tree.metadata.get("source"), "wsj_0600");
  BOOST_CHECK_EQUAL(tree.metadata.get("missing"), "");

  BOOST_CHECK(is >> tree);
  BOOST_CHECK_EQUAL(tree.size(), 4);
  BOOST_CHECK(tree.has_sentences());
  BOOST_CHECK(tree.has_nuclearity());
  BOOST_CHECK(tree.metadata.empty());
  BOOST_CHECK_EQUAL(tree.sentences[2], 0);
  BOOST_CHECK_EQUAL(tree.sentences[3], 1);

  BOOST_CHECK(! (is >> tree));
}

BOOST_AUTO_TEST_CASE(write_blocks)
{
  std::istringstream is(document);

  tree_type tree;
  is >> tree;

  std::ostringstream os;
  os << tree;

  std::istringstream ris(os.str());
  tree_type reread;
  BOOST_CHECK(ris >> reread);

  BOOST_CHECK(tree.units == reread.units);
  BOOST_CHECK(tree.heads == reread.heads);
  BOOST_CHECK(tree.labels == reread.labels);
  BOOST_CHECK(tree.nuclearity == reread.nuclearity);
  BOOST_CHECK(tree.metadata == reread.metadata);

  // preferred keys first
  BOOST_CHECK_EQUAL(os.str().substr(0, 11), "# id = d1\n#");
}

BOOST_AUTO_TEST_CASE(malformed)
{
  {
    std::istringstream is("1 0..10 0 ROOT N\n3 11..20 1 elaboration S\n");
    tree_type tree;
    BOOST_CHECK_THROW(is >> tree, std::runtime_error);
  }

  {
    std::istringstream is("1 0..10 0 ROOT N 0\n2 11..20 1 elaboration S\n");
    tree_type tree;
    BOOST_CHECK_THROW(is >> tree, std::runtime_error);
  }

  {
    std::istringstream is("1 10..0 0 ROOT N\n");
    tree_type tree;
    BOOST_CHECK_THROW(is >> tree, std::runtime_error);
  }

  {
    std::istringstream is("1 0..10 0 ROOT N zero\n");
    tree_type tree;
    BOOST_CHECK_THROW(is >> tree, std::runtime_error);
  }
}

BOOST_AUTO_TEST_CASE(metadata_order)
{
  disco::Metadata metadata;

  metadata.set("source", "a");
  metadata.set("author", "b");
  metadata.set("genre", "c");
  metadata.set("id", "d");
  metadata.set("author", "e");

  disco::Metadata::const_iterator iter = metadata.begin();

  BOOST_CHECK_EQUAL(metadata.size(), 4);
  BOOST_CHECK_EQUAL(iter->first, "id");
  ++ iter;
  BOOST_CHECK_EQUAL(iter->first, "author");
  BOOST_CHECK_EQUAL(iter->second, "e");
  ++ iter;
  BOOST_CHECK_EQUAL(iter->first, "source");
  ++ iter;
  BOOST_CHECK_EQUAL(iter->first, "genre");

  metadata.erase("source");
  BOOST_CHECK(! metadata.has("source"));
  BOOST_CHECK_EQUAL(metadata.size(), 3);
}

BOOST_AUTO_TEST_CASE(structure)
{
  tree_type tree;

  tree.add(disco::Unit(0, disco::Span(0, 10)), 2, "elaboration");
  tree.add(disco::Unit(1, disco::Span(11, 20)), 0, "ROOT");
  tree.add(disco::Unit(2, disco::Span(21, 30)), 2, "joint");
  tree.add(disco::Unit(3, disco::Span(31, 40)), 2, "elaboration");

  BOOST_CHECK_NO_THROW(tree.verify());

  const tree_type::index_set_type roots = tree.real_roots();
  BOOST_CHECK_EQUAL(roots.size(), 1);
  BOOST_CHECK_EQUAL(roots.front(), 2);

  tree_type::index_set_type deps = tree.dependents(2);
  BOOST_CHECK_EQUAL(deps.size(), 3);
  BOOST_CHECK_EQUAL(deps[0], 1);
  BOOST_CHECK_EQUAL(deps[2], 4);

  // by rank when ranked
  tree.ranks.resize(tree.size(), 0);
  tree.ranks[1] = 2;
  tree.ranks[3] = 0;
  tree.ranks[4] = 1;

  deps = tree.dependents(2);
  BOOST_CHECK_EQUAL(deps[0], 3);
  BOOST_CHECK_EQUAL(deps[1], 4);
  BOOST_CHECK_EQUAL(deps[2], 1);

  tree.heads[2] = 3;
  try {
    tree.verify();
    BOOST_FAIL("a cycle is accepted");
  }
  catch (disco::structural_error& err) {
    BOOST_CHECK(err.node > 0);
  }

  tree.heads[2] = 2;
  BOOST_CHECK_THROW(tree.verify(), disco::structural_error);

  tree.heads[2] = 7;
  BOOST_CHECK_THROW(tree.verify(), disco::structural_error);
}
