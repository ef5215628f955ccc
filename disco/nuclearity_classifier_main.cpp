//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>
#include <sstream>
#include <string>

#include "disco/nuclearity_classifier.hpp"
#include "disco/relation_statistics.hpp"
#include "disco/error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE nuclearity_classifier_test

#include <boost/test/unit_test.hpp>

typedef disco::NuclearityClassifier classifier_type;
typedef disco::RelationStatistics   statistics_type;
typedef disco::DependencyTree       tree_type;

// e0 <-elaboration- e1 -joint-> e2 -same-unit-> e3
//                   e1 -contrast-> e4
tree_type make_tree()
{
  tree_type tree;

  tree.add(disco::Unit(0, disco::Span(0, 10)),  2, "elaboration", disco::Nuclearity::satellite);
  tree.add(disco::Unit(1, disco::Span(11, 20)), 0, "ROOT",        disco::Nuclearity::nucleus);
  tree.add(disco::Unit(2, disco::Span(21, 30)), 2, "joint",       disco::Nuclearity::nucleus);
  tree.add(disco::Unit(3, disco::Span(31, 40)), 3, "same-unit",   disco::Nuclearity::nucleus);
  tree.add(disco::Unit(4, disco::Span(41, 50)), 2, "contrast",    disco::Nuclearity::satellite);

  return tree;
}

BOOST_AUTO_TEST_CASE(strategy)
{
  BOOST_CHECK_EQUAL(classifier_type::strategy("unamb_else_most_frequent"), classifier_type::unamb_else_most_frequent);
  BOOST_CHECK_EQUAL(classifier_type::strategy("most-frequent-by-rel"), classifier_type::most_frequent_by_rel);

  BOOST_CHECK_THROW(classifier_type("majority"), disco::configuration_error);
  BOOST_CHECK_THROW(classifier_type("unamb_else_most_frequent:statistics=stats.txt"), disco::configuration_error);
  BOOST_CHECK_THROW(classifier_type("most_frequent_by_rel:smoothing=1"), disco::configuration_error);
  BOOST_CHECK_NO_THROW(classifier_type("most_frequent_by_rel:statistics=stats.txt"));

  BOOST_CHECK_THROW(classifier_type("most_frequent_by_rel:statistics=a.txt,statistics=b.txt"), disco::configuration_error);
  BOOST_CHECK_THROW(classifier_type("most_frequent_by_rel:statistics"), disco::configuration_error);
  BOOST_CHECK_THROW(classifier_type("most_frequent_by_rel:"), disco::configuration_error);
  BOOST_CHECK_THROW(classifier_type(""), disco::configuration_error);
}

BOOST_AUTO_TEST_CASE(unamb_else_most_frequent)
{
  classifier_type classifier;

  const tree_type tree = make_tree();

  BOOST_CHECK(! classifier.fitted());
  BOOST_CHECK_THROW(classifier.predict(tree), disco::precondition_error);

  classifier.fit(classifier_type::tree_set_type(), classifier_type::nuclearity_map_type());
  BOOST_CHECK(classifier.fitted());
  BOOST_CHECK_EQUAL(classifier.multinuclear().size(), 3);

  const classifier_type::nuclearity_set_type predicted = classifier.predict(tree);

  BOOST_CHECK_EQUAL(predicted.size(), tree.size());
  BOOST_CHECK(predicted[0].is_root());
  BOOST_CHECK(predicted[1].is_satellite());
  BOOST_CHECK(predicted[3].is_nucleus());
  BOOST_CHECK(predicted[4].is_nucleus());
  BOOST_CHECK(predicted[5].is_satellite());

  // relation names are case sensitive
  tree_type upper = make_tree();
  upper.labels[3] = "Joint";
  BOOST_CHECK(classifier.predict(upper)[3].is_satellite());

  // a fixed table never consults relation statistics
  statistics_type statistics;
  BOOST_CHECK_NO_THROW(classifier.fit(classifier_type::tree_set_type(), classifier_type::nuclearity_map_type(), statistics));

  statistics.add("elaboration", "NN");
  BOOST_CHECK_THROW(classifier.fit(classifier_type::tree_set_type(), classifier_type::nuclearity_map_type(), statistics),
		    disco::configuration_error);
}

BOOST_AUTO_TEST_CASE(annotate)
{
  classifier_type classifier;
  classifier.fit(classifier_type::tree_set_type(), classifier_type::nuclearity_map_type());

  tree_type tree = make_tree();
  tree.nuclearity[1] = disco::Nuclearity::nucleus;
  tree.nuclearity[5] = disco::Nuclearity();

  tree_type kept = tree;
  classifier.annotate(kept, false);
  BOOST_CHECK(kept.nuclearity[1].is_nucleus());
  BOOST_CHECK(kept.nuclearity[5].is_satellite());
  BOOST_CHECK(kept.has_nuclearity());

  classifier.annotate(tree);
  BOOST_CHECK(tree.nuclearity[1].is_satellite());
  BOOST_CHECK(tree.nuclearity[5].is_satellite());
}

BOOST_AUTO_TEST_CASE(relation_statistics)
{
  const tree_type tree = make_tree();

  statistics_type statistics;
  statistics.collect(tree);

  BOOST_CHECK_EQUAL(statistics.count("elaboration", "SN"), 1);
  BOOST_CHECK_EQUAL(statistics.count("contrast", "NS"), 1);
  BOOST_CHECK_EQUAL(statistics.count("joint", "NN"), 1);
  BOOST_CHECK_EQUAL(statistics.count("ROOT", "NN"), 0);
  BOOST_CHECK_EQUAL(statistics.count("unknown", "NN"), 0);

  BOOST_CHECK_EQUAL(statistics.most_frequent("elaboration"), "SN");
  BOOST_CHECK_EQUAL(statistics.most_frequent("unknown"), "");

  // ties go to the earlier pattern, NN before NS before SN
  statistics.add("contrast", "NN");
  BOOST_CHECK_EQUAL(statistics.most_frequent("contrast"), "NN");
  statistics.add("elaboration", "NS");
  BOOST_CHECK_EQUAL(statistics.most_frequent("elaboration"), "NS");

  BOOST_CHECK_THROW(statistics.add("contrast", "SS"), std::runtime_error);

  std::ostringstream os;
  os << statistics;

  std::istringstream is("# relation pattern count\n" + os.str());
  statistics_type reread;
  is >> reread;

  BOOST_CHECK_EQUAL(reread.size(), statistics.size());
  BOOST_CHECK_EQUAL(reread.count("contrast", "NN"), 1);
  BOOST_CHECK_EQUAL(reread.count("same-unit", "NN"), 1);
}

BOOST_AUTO_TEST_CASE(most_frequent_by_rel)
{
  classifier_type classifier("most_frequent_by_rel");

  classifier_type::tree_set_type trees(1, make_tree());
  classifier_type::nuclearity_map_type labels(1, trees.front().nuclearity);

  // gold nuclearity from the training trees
  classifier.fit(trees, labels);

  BOOST_CHECK_EQUAL(classifier.multinuclear().size(), 2);
  BOOST_CHECK_EQUAL(classifier.multinuclear().front(), "joint");
  BOOST_CHECK_EQUAL(classifier.multinuclear().back(), "same-unit");

  tree_type tree = make_tree();
  tree.labels[5] = "joint";
  tree.labels[1] = "textual";

  const classifier_type::nuclearity_set_type predicted = classifier.predict(tree);
  BOOST_CHECK(predicted[5].is_nucleus());
  BOOST_CHECK(predicted[1].is_satellite());

  // statistics given explicitly
  statistics_type statistics;
  statistics.add("textual", "NN", 3);
  statistics.add("textual", "NS", 1);

  classifier.fit(classifier_type::tree_set_type(), classifier_type::nuclearity_map_type(), statistics);
  BOOST_CHECK_EQUAL(classifier.multinuclear().size(), 1);
  BOOST_CHECK(classifier.predict(tree)[1].is_nucleus());

  classifier_type empty("most_frequent_by_rel");
  BOOST_CHECK_THROW(empty.fit(classifier_type::tree_set_type(), classifier_type::nuclearity_map_type()), disco::configuration_error);

  // mismatched training data
  BOOST_CHECK_THROW(empty.fit(trees, classifier_type::nuclearity_map_type()), std::runtime_error);
}
