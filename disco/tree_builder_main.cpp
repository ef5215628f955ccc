//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "disco/tree_builder.hpp"
#include "disco/dep2con.hpp"
#include "disco/error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE tree_builder_test

#include <boost/test/unit_test.hpp>

typedef disco::TreeBuilder      builder_type;
typedef disco::DependencyTree   dependency_type;
typedef disco::ConstituencyTree tree_type;

disco::Unit make_unit(const int index)
{
  return disco::Unit(index, disco::Span(index * 10, index * 10 + 9));
}

// e1 is the root, e0 its left dependent, e2 and e3 its right dependents
dependency_type make_dependency()
{
  dependency_type dependency;

  dependency.add(make_unit(0), 2, "L",    disco::Nuclearity::satellite);
  dependency.add(make_unit(1), 0, "ROOT", disco::Nuclearity::nucleus);
  dependency.add(make_unit(2), 2, "R1",   disco::Nuclearity::satellite);
  dependency.add(make_unit(3), 2, "R2",   disco::Nuclearity::satellite);

  return dependency;
}

// a larger tree with dependents on both sides at several levels
dependency_type make_document()
{
  dependency_type dependency;

  dependency.add(make_unit(0), 3, "attribution");
  dependency.add(make_unit(1), 3, "joint");
  dependency.add(make_unit(2), 0, "ROOT");
  dependency.add(make_unit(3), 3, "elaboration");
  dependency.add(make_unit(4), 6, "same-unit");
  dependency.add(make_unit(5), 3, "joint");
  dependency.add(make_unit(6), 6, "explanation");
  dependency.add(make_unit(7), 9, "condition");
  dependency.add(make_unit(8), 6, "elaboration");

  return dependency;
}

// binary, ordered, non overlapping, with spans covering their antecedents
void check_tree(const tree_type& tree)
{
  if (tree.leaf()) {
    BOOST_CHECK(! tree.unit().fake());
    BOOST_CHECK_EQUAL(tree.edu_span().first, tree.unit().index);
    BOOST_CHECK_EQUAL(tree.edu_span().second, tree.unit().index);
    BOOST_CHECK_EQUAL(tree.span(), tree.unit().span);
    return;
  }

  BOOST_CHECK_EQUAL(tree.end() - tree.begin(), 2);

  const tree_type& left  = tree.left();
  const tree_type& right = tree.right();

  BOOST_CHECK(! left.span().overlaps(right.span()));
  BOOST_CHECK(left.span() < right.span());
  BOOST_CHECK_EQUAL(tree.span(), left.span().merge(right.span()));
  BOOST_CHECK_EQUAL(tree.edu_span().first, left.edu_span().first);
  BOOST_CHECK_EQUAL(tree.edu_span().second, right.edu_span().second);
  BOOST_CHECK_EQUAL(left.edu_span().second + 1, right.edu_span().first);

  BOOST_CHECK(left.nuclearity().is_nucleus() || right.nuclearity().is_nucleus());

  check_tree(left);
  check_tree(right);
}

// units 0..8, added out of textual order. e4 heads e3 e5 e6 e2 e0 e8 in this order, which is
// inside-out on either side with the sides interleaved. e6 heads e7, e0 heads e1.
dependency_type make_interleaved()
{
  dependency_type dependency;

  dependency.add(make_unit(3), 7, "elaboration"); // 1
  dependency.add(make_unit(5), 7, "elaboration"); // 2
  dependency.add(make_unit(6), 7, "elaboration"); // 3
  dependency.add(make_unit(2), 7, "elaboration"); // 4
  dependency.add(make_unit(0), 7, "elaboration"); // 5
  dependency.add(make_unit(8), 7, "elaboration"); // 6
  dependency.add(make_unit(4), 0, "ROOT");        // 7
  dependency.add(make_unit(7), 3, "elaboration"); // 8
  dependency.add(make_unit(1), 5, "elaboration"); // 9

  return dependency;
}

typedef std::vector<dependency_type::index_set_type, std::allocator<dependency_type::index_set_type> > order_map_type;

// node heading the subtree. The dependents folded into each head are collected innermost first.
dependency_type::index_type recover(const dependency_type& dependency, const tree_type& tree, order_map_type& orders)
{
  if (tree.leaf()) {
    for (dependency_type::size_type i = 1; i != dependency.size(); ++ i)
      if (dependency.units[i] == tree.unit())
	return i;

    BOOST_FAIL("unknown unit in a leaf");
    return -1;
  }

  const dependency_type::index_type left  = recover(dependency, tree.left(), orders);
  const dependency_type::index_type right = recover(dependency, tree.right(), orders);

  if (dependency.heads[left] == right) {
    orders[right].push_back(left);
    return right;
  }

  BOOST_CHECK_EQUAL(dependency.heads[right], left);
  orders[left].push_back(right);
  return left;
}

BOOST_AUTO_TEST_CASE(rotation)
{
  dependency_type dependency = make_dependency();

  disco::AttachmentRanker("id").annotate(dependency);

  BOOST_CHECK_EQUAL(dependency.ranks[1], 0);
  BOOST_CHECK_EQUAL(dependency.ranks[3], 1);
  BOOST_CHECK_EQUAL(dependency.ranks[4], 2);

  const tree_type tree = builder_type().convert(dependency);

  check_tree(tree);

  BOOST_CHECK(tree.nuclearity().is_root());
  BOOST_CHECK_EQUAL(tree.relation(), "R2");
  BOOST_CHECK_EQUAL(tree.edu_span().first, 0);
  BOOST_CHECK_EQUAL(tree.edu_span().second, 3);
  BOOST_CHECK_EQUAL(tree.size(), 7);
  BOOST_CHECK_EQUAL(tree.depth(), 4);

  // e3 outermost right
  BOOST_CHECK(tree.right().leaf());
  BOOST_CHECK(tree.right().unit() == make_unit(3));
  BOOST_CHECK(tree.right().nuclearity().is_satellite());

  const tree_type& r1 = tree.left();
  BOOST_CHECK_EQUAL(r1.relation(), "R1");
  BOOST_CHECK(r1.nuclearity().is_nucleus());
  BOOST_CHECK(r1.right().unit() == make_unit(2));

  // e0 innermost left
  const tree_type& l = r1.left();
  BOOST_CHECK_EQUAL(l.relation(), "L");
  BOOST_CHECK(l.left().leaf());
  BOOST_CHECK(l.left().unit() == make_unit(0));
  BOOST_CHECK(l.left().nuclearity().is_satellite());
  BOOST_CHECK(l.right().unit() == make_unit(1));
  BOOST_CHECK(l.right().nuclearity().is_nucleus());

  std::ostringstream os;
  os << tree;
  BOOST_CHECK_EQUAL(os.str(), "(R:R2 0-3 0..39 (N:R1 0-2 0..29 (N:L 0-1 0..19 (S:leaf 0-0 0..9) (N:leaf 1-1 10..19)) (S:leaf 2-2 20..29)) (S:leaf 3-3 30..39))");
}

BOOST_AUTO_TEST_CASE(unranked)
{
  // without ranks, dependents are folded in node order
  const dependency_type dependency = make_dependency();

  const tree_type tree = builder_type().convert(dependency);

  BOOST_CHECK_EQUAL(tree.relation(), "R2");
  BOOST_CHECK_EQUAL(tree.left().left().relation(), "L");
}

BOOST_AUTO_TEST_CASE(leaves)
{
  const char* names[] = {"id", "lllrrr", "rrrlll", "lrlrlr", "rlrlrl", "closest-lr", "closest-rl"};

  disco::NuclearityClassifier classifier;
  classifier.fit(disco::NuclearityClassifier::tree_set_type(), disco::NuclearityClassifier::nuclearity_map_type());

  const dependency_type dependency = make_document();

  for (int i = 0; i != 7; ++ i) {
    const disco::Dep2Con dep2con(classifier, disco::AttachmentRanker(names[i]));

    const tree_type tree = dep2con(dependency);

    check_tree(tree);

    tree_type::unit_set_type units;
    tree.leaves(units);

    BOOST_CHECK(units == tree_type::unit_set_type(dependency.units.begin() + 1, dependency.units.end()));
    BOOST_CHECK_EQUAL(tree.size(), 2 * units.size() - 1);
    BOOST_CHECK(tree.nuclearity().is_root());
  }
}

BOOST_AUTO_TEST_CASE(single)
{
  dependency_type dependency;
  dependency.add(make_unit(0), 0, "ROOT", disco::Nuclearity::nucleus);

  const tree_type tree = builder_type().convert(dependency);

  BOOST_CHECK(tree.leaf());
  BOOST_CHECK(tree.nuclearity().is_root());
  BOOST_CHECK(tree.unit() == make_unit(0));
}

BOOST_AUTO_TEST_CASE(invalid)
{
  builder_type builder;

  {
    dependency_type dependency = make_dependency();
    dependency.heads[4] = 0;

    BOOST_CHECK_THROW(builder.convert(dependency), disco::structural_error);
  }

  {
    dependency_type dependency;
    BOOST_CHECK_THROW(builder.convert(dependency), disco::structural_error);
  }

  {
    dependency_type dependency = make_dependency();
    dependency.nuclearity[3] = disco::Nuclearity();

    BOOST_CHECK_THROW(builder.convert(dependency), disco::precondition_error);
  }

  {
    // e1 depends on e3, which is attached after e2 covering e0 .. e2
    dependency_type dependency;
    dependency.add(make_unit(0), 0, "ROOT",        disco::Nuclearity::nucleus);
    dependency.add(make_unit(1), 4, "elaboration", disco::Nuclearity::satellite);
    dependency.add(make_unit(2), 1, "elaboration", disco::Nuclearity::satellite);
    dependency.add(make_unit(3), 1, "elaboration", disco::Nuclearity::satellite);

    try {
      builder.convert(dependency);
      BOOST_FAIL("overlapping spans are accepted");
    }
    catch (disco::structural_error& err) {
      BOOST_CHECK_EQUAL(err.node, 4);
    }
  }
}

BOOST_AUTO_TEST_CASE(dep2con)
{
  disco::NuclearityClassifier classifier;

  const dependency_type dependency = make_document();

  BOOST_CHECK_THROW(disco::Dep2Con(classifier, disco::AttachmentRanker())(dependency), disco::precondition_error);

  classifier.fit(disco::NuclearityClassifier::tree_set_type(), disco::NuclearityClassifier::nuclearity_map_type());

  // given nuclearity is kept unless overridden
  dependency_type given = make_dependency();
  given.nuclearity[1] = disco::Nuclearity::nucleus;

  const tree_type kept       = disco::Dep2Con(classifier, disco::AttachmentRanker())(given);
  const tree_type overridden = disco::Dep2Con(classifier, disco::AttachmentRanker(), true)(given);

  BOOST_CHECK(kept.left().left().left().nuclearity().is_nucleus());
  BOOST_CHECK(overridden.left().left().left().nuclearity().is_satellite());
  BOOST_CHECK(kept != overridden);

  // the source is left untouched
  BOOST_CHECK(! given.has_ranks());
}

BOOST_AUTO_TEST_CASE(fold_order)
{
  const dependency_type unranked = make_interleaved();

  dependency_type dependency = unranked;
  disco::AttachmentRanker("id").annotate(dependency);

  const tree_type tree = builder_type().convert(dependency);

  check_tree(tree);
  BOOST_CHECK_EQUAL(tree.size(), 17);

  order_map_type orders(dependency.size());
  BOOST_CHECK_EQUAL(recover(dependency, tree, orders), 7);

  for (dependency_type::index_type head = 0; head != dependency_type::index_type(dependency.size()); ++ head) {
    BOOST_CHECK(orders[head] == dependency.dependents(head));
    BOOST_CHECK(orders[head] == unranked.dependents(head));
  }

  BOOST_CHECK_EQUAL(orders[7].size(), 6);
  BOOST_CHECK_EQUAL(orders[7].front(), 1);
  BOOST_CHECK_EQUAL(orders[7].back(), 6);
  BOOST_CHECK_EQUAL(orders[3].size(), 1);
  BOOST_CHECK_EQUAL(orders[3].front(), 8);
  BOOST_CHECK_EQUAL(orders[5].size(), 1);
  BOOST_CHECK_EQUAL(orders[5].front(), 9);
}

BOOST_AUTO_TEST_CASE(out_of_range_head)
{
  disco::NuclearityClassifier classifier;
  classifier.fit(disco::NuclearityClassifier::tree_set_type(), disco::NuclearityClassifier::nuclearity_map_type());

  const disco::Dep2Con dep2con(classifier, disco::AttachmentRanker("id"));

  std::istringstream is("1 0..9 0 ROOT N\n2 10..19 100000 elaboration S\n");
  dependency_type dependency;
  is >> dependency;

  try {
    dep2con(dependency);
    BOOST_FAIL("an out of range head is accepted");
  }
  catch (disco::structural_error& err) {
    BOOST_CHECK_EQUAL(err.node, 2);
  }

  dependency_type negative = make_document();
  negative.heads[5] = -1;
  BOOST_CHECK_THROW(dep2con(negative), disco::structural_error);
  BOOST_CHECK_THROW(builder_type().convert(negative), disco::structural_error);
}

BOOST_AUTO_TEST_CASE(large)
{
  disco::NuclearityClassifier classifier;
  classifier.fit(disco::NuclearityClassifier::tree_set_type(), disco::NuclearityClassifier::nuclearity_map_type());

  const disco::Dep2Con dep2con(classifier, disco::AttachmentRanker("id"));

  const int num_units = 2000;

  // e0 heads every other unit
  dependency_type wide;
  wide.add(make_unit(0), 0, "ROOT");
  for (int i = 1; i != num_units; ++ i)
    wide.add(make_unit(i), 1, "elaboration");

  // every unit depends on the next one
  dependency_type chain;
  for (int i = 0; i != num_units; ++ i)
    chain.add(make_unit(i), (i + 1 == num_units ? 0 : i + 2), (i + 1 == num_units ? "ROOT" : "elaboration"));

  const tree_type wide_tree  = dep2con(wide);
  const tree_type chain_tree = dep2con(chain);

  tree_type::unit_set_type units;

  wide_tree.leaves(units);
  BOOST_CHECK_EQUAL(units.size(), num_units);
  BOOST_CHECK(units == tree_type::unit_set_type(wide.units.begin() + 1, wide.units.end()));
  BOOST_CHECK_EQUAL(wide_tree.size(), 2 * num_units - 1);
  BOOST_CHECK_EQUAL(wide_tree.depth(), num_units);
  BOOST_CHECK_EQUAL(wide_tree.edu_span().second, num_units - 1);

  units.clear();
  chain_tree.leaves(units);
  BOOST_CHECK_EQUAL(units.size(), num_units);
  BOOST_CHECK(units == tree_type::unit_set_type(chain.units.begin() + 1, chain.units.end()));
  BOOST_CHECK_EQUAL(chain_tree.size(), 2 * num_units - 1);
  BOOST_CHECK_EQUAL(chain_tree.depth(), num_units);
  BOOST_CHECK(chain_tree.right().unit() == make_unit(num_units - 1));
}
