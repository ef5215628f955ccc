//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <sstream>
#include <string>

#include "disco/attachment_ranker.hpp"
#include "disco/error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE attachment_ranker_test

#include <boost/test/unit_test.hpp>

typedef disco::AttachmentRanker ranker_type;
typedef disco::DependencyTree   tree_type;

typedef tree_type::rank_set_type rank_set_type;

disco::Unit make_unit(const int index)
{
  return disco::Unit(index, disco::Span(index * 10, index * 10 + 9));
}

// units l3 l2 l1 h r1 r2 r3 at 0..6, added as nodes in the order l3 r1 r3 l2 l1 r2 h
tree_type make_tree()
{
  tree_type tree;

  tree.add(make_unit(0), 7, "elaboration"); // 1: l3
  tree.add(make_unit(4), 7, "elaboration"); // 2: r1
  tree.add(make_unit(6), 7, "elaboration"); // 3: r3
  tree.add(make_unit(1), 7, "elaboration"); // 4: l2
  tree.add(make_unit(2), 7, "elaboration"); // 5: l1
  tree.add(make_unit(5), 7, "elaboration"); // 6: r2
  tree.add(make_unit(3), 0, "ROOT");        // 7: h

  return tree;
}

// units 0..4 with sentences 0 1 1 1 2, unit 2 heads the others
tree_type make_sentence_tree()
{
  tree_type tree;

  tree.add(make_unit(0), 3, "background",  disco::Nuclearity(), 0);
  tree.add(make_unit(1), 3, "attribution", disco::Nuclearity(), 1);
  tree.add(make_unit(2), 0, "ROOT",        disco::Nuclearity(), 1);
  tree.add(make_unit(3), 3, "elaboration", disco::Nuclearity(), 1);
  tree.add(make_unit(4), 3, "explanation", disco::Nuclearity(), 2);

  return tree;
}

void check_order(const rank_set_type& ranks, const int* nodes, const int size)
{
  for (int i = 0; i != size; ++ i)
    BOOST_CHECK_EQUAL(ranks[nodes[i]], i);
}

BOOST_AUTO_TEST_CASE(strategy)
{
  BOOST_CHECK_EQUAL(ranker_type().strategy(), ranker_type::id);
  BOOST_CHECK_EQUAL(ranker_type::strategy("closest-intra-rl-inter-lr"), ranker_type::closest_intra_rl_inter_lr);
  BOOST_CHECK_EQUAL(std::string(ranker_type::name(ranker_type::rrrlll)), "rrrlll");

  BOOST_CHECK(ranker_type::sentential(ranker_type::closest_intra_lr_inter_lr));
  BOOST_CHECK(! ranker_type::sentential(ranker_type::closest_lr));

  BOOST_CHECK_THROW(ranker_type("closest"), disco::configuration_error);
  BOOST_CHECK_THROW(ranker_type("closest_lr"), disco::configuration_error);
  BOOST_CHECK_THROW(ranker_type("lllrrr:order=1"), disco::configuration_error);
  BOOST_CHECK_THROW(ranker_type("id:"), disco::configuration_error);
  BOOST_CHECK_THROW(ranker_type("id:order"), disco::configuration_error);
}

BOOST_AUTO_TEST_CASE(out_of_range_head)
{
  const ranker_type ranker("id");

  std::istringstream is("1 0..9 0 ROOT N\n2 10..19 100000 elaboration S\n");
  tree_type tree;
  is >> tree;
  BOOST_CHECK_EQUAL(tree.size(), 3);

  try {
    ranker.predict(tree);
    BOOST_FAIL("an out of range head is accepted");
  }
  catch (disco::structural_error& err) {
    BOOST_CHECK_EQUAL(err.node, 2);
  }

  tree_type negative = make_tree();
  negative.heads[3] = -1;
  BOOST_CHECK_THROW(ranker.predict(negative), disco::structural_error);

  const char* names[] = {"id", "lllrrr", "closest-lr", "closest-intra-rl-inter-lr"};

  tree_type cyclic = make_tree();
  cyclic.heads[7] = 1;
  for (int i = 0; i != 4; ++ i)
    BOOST_CHECK_THROW(ranker_type(names[i]).predict(cyclic), disco::structural_error);
}

BOOST_AUTO_TEST_CASE(permutation)
{
  const char* names[] = {"id", "lllrrr", "rrrlll", "lrlrlr", "rlrlrl",
			 "closest-lr", "closest-rl",
			 "closest-intra-rl-inter-lr", "closest-intra-rl-inter-rl", "closest-intra-lr-inter-lr"};

  const tree_type tree = make_sentence_tree();

  // a single sentence
  tree_type wide = make_tree();
  wide.sentences.assign(wide.size(), 0);

  for (int i = 0; i != 10; ++ i) {
    const ranker_type ranker(names[i]);

    BOOST_CHECK_NO_THROW(ranker_type::verify(tree, ranker.predict(tree)));
    BOOST_CHECK_NO_THROW(ranker_type::verify(wide, ranker.predict(wide)));

    const rank_set_type ranks = ranker.predict(wide);

    // inside-out on either side
    BOOST_CHECK(ranks[5] < ranks[4]);
    BOOST_CHECK(ranks[4] < ranks[1]);
    BOOST_CHECK(ranks[2] < ranks[6]);
    BOOST_CHECK(ranks[6] < ranks[3]);

    BOOST_CHECK_EQUAL(ranks[7], 0);
  }
}

BOOST_AUTO_TEST_CASE(id)
{
  const tree_type tree = make_tree();

  // slots L R R L L R: l1 r1 r2 l2 l3 r3
  const int order[] = {5, 2, 6, 4, 1, 3};
  check_order(ranker_type("id").predict(tree), order, 6);

  // an already inside-out order is kept as is
  tree_type simple;
  simple.add(make_unit(1), 0, "ROOT");
  simple.add(make_unit(0), 1, "elaboration");
  simple.add(make_unit(2), 1, "elaboration");
  simple.add(make_unit(3), 1, "elaboration");

  const int simple_order[] = {2, 3, 4};
  check_order(ranker_type("id").predict(simple), simple_order, 3);
}

BOOST_AUTO_TEST_CASE(sided)
{
  const tree_type tree = make_tree();

  const int lllrrr[] = {5, 4, 1, 2, 6, 3};
  const int rrrlll[] = {2, 6, 3, 5, 4, 1};
  const int lrlrlr[] = {5, 2, 4, 6, 1, 3};
  const int rlrlrl[] = {2, 5, 6, 4, 3, 1};

  check_order(ranker_type("lllrrr").predict(tree), lllrrr, 6);
  check_order(ranker_type("rrrlll").predict(tree), rrrlll, 6);
  check_order(ranker_type("lrlrlr").predict(tree), lrlrlr, 6);
  check_order(ranker_type("rlrlrl").predict(tree), rlrlrl, 6);

  // uneven sides
  tree_type uneven;
  uneven.add(make_unit(0), 0, "ROOT");
  uneven.add(make_unit(1), 1, "elaboration");
  uneven.add(make_unit(2), 1, "elaboration");

  const int uneven_order[] = {2, 3};
  check_order(ranker_type("rlrlrl").predict(uneven), uneven_order, 2);
  check_order(ranker_type("lrlrlr").predict(uneven), uneven_order, 2);
}

BOOST_AUTO_TEST_CASE(closest)
{
  tree_type tree;
  tree.add(make_unit(0), 2, "attribution");
  tree.add(make_unit(1), 0, "ROOT");
  tree.add(make_unit(2), 2, "elaboration");
  tree.add(make_unit(4), 2, "elaboration");

  const int lr[] = {1, 3, 4};
  const int rl[] = {3, 1, 4};

  check_order(ranker_type("closest-lr").predict(tree), lr, 3);
  check_order(ranker_type("closest-rl").predict(tree), rl, 3);
}

BOOST_AUTO_TEST_CASE(sentential)
{
  const tree_type tree = make_sentence_tree();

  // intra: 2 (left) 4 (right), inter: 1 (left) 5 (right), all at equal distances on either side
  const int intra_rl_inter_lr[] = {4, 2, 1, 5};
  const int intra_rl_inter_rl[] = {4, 2, 5, 1};
  const int intra_lr_inter_lr[] = {2, 4, 1, 5};

  check_order(ranker_type("closest-intra-rl-inter-lr").predict(tree), intra_rl_inter_lr, 4);
  check_order(ranker_type("closest-intra-rl-inter-rl").predict(tree), intra_rl_inter_rl, 4);
  check_order(ranker_type("closest-intra-lr-inter-lr").predict(tree), intra_lr_inter_lr, 4);

  const tree_type plain = make_tree();
  BOOST_CHECK_THROW(ranker_type("closest-intra-rl-inter-lr").predict(plain), disco::precondition_error);
  BOOST_CHECK_NO_THROW(ranker_type("closest-rl").predict(plain));
}

BOOST_AUTO_TEST_CASE(annotate)
{
  tree_type tree = make_tree();

  ranker_type("lllrrr").annotate(tree);
  BOOST_CHECK(tree.has_ranks());

  const tree_type::index_set_type deps = tree.dependents(7);
  BOOST_CHECK_EQUAL(deps.size(), 6);
  BOOST_CHECK_EQUAL(deps.front(), 5);
  BOOST_CHECK_EQUAL(deps.back(), 3);

  rank_set_type ranks = tree.ranks;
  ranks[1] = ranks[4];
  try {
    ranker_type::verify(tree, ranks);
    BOOST_FAIL("duplicated ranks are accepted");
  }
  catch (disco::invariant_violation& err) {
    BOOST_CHECK_EQUAL(err.head, 7);
  }
}
