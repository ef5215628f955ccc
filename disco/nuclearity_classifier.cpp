//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>
#include <iostream>

#include <boost/lexical_cast.hpp>

#include "nuclearity_classifier.hpp"
#include "parameter.hpp"
#include "error.hpp"

namespace disco
{
  const char* NuclearityClassifier::lists()
  {
    static const char* desc = "\
unamb_else_most_frequent: multinuclear for joint, same-unit and textual, mononuclear otherwise\n\
most_frequent_by_rel: the most frequent nuclearity of each relation in the training data\n\
\tstatistics=<file> relation statistics (relation pattern count), else collected from training trees\n\
";
    return desc;
  }

  NuclearityClassifier::strategy_type NuclearityClassifier::strategy(const std::string& name)
  {
    if (name == "unamb_else_most_frequent" || name == "unamb-else-most-frequent")
      return unamb_else_most_frequent;
    else if (name == "most_frequent_by_rel" || name == "most-frequent-by-rel")
      return most_frequent_by_rel;
    else
      throw configuration_error("unknown nuclearity strategy: " + name);
  }

  NuclearityClassifier::NuclearityClassifier(const std::string& parameter, const int __debug)
    : __strategy(unamb_else_most_frequent), __name(), __statistics(), __multinuclear(), __fitted(false), debug(__debug)
  {
    static const char* keys[] = {"statistics", 0};

    const Parameter param(parameter, keys);

    __strategy = strategy(param.name());
    __name = (__strategy == unamb_else_most_frequent ? "unamb_else_most_frequent" : "most_frequent_by_rel");

    if (param.has("statistics") && __strategy != most_frequent_by_rel)
      throw configuration_error("unsupported parameter for " + __name + ": statistics");

    __statistics = param.get("statistics");
  }

  void NuclearityClassifier::fit(const tree_set_type& trees, const nuclearity_map_type& labels)
  {
    if (trees.size() != labels.size())
      throw std::runtime_error("# of trees and # of nuclearity labels do not match");

    for (size_type i = 0; i != trees.size(); ++ i)
      if (trees[i].size() != labels[i].size())
	throw std::runtime_error("nuclearity labels do not match the size of tree " + boost::lexical_cast<std::string>(i));

    statistics_type statistics;

    if (__strategy == most_frequent_by_rel) {
      if (! __statistics.empty())
	statistics.read(__statistics);
      else
	for (size_type i = 0; i != trees.size(); ++ i)
	  statistics.collect(trees[i], labels[i]);

      if (statistics.empty())
	throw configuration_error("no relation statistics for most_frequent_by_rel");
    }

    configure(statistics);
  }

  void NuclearityClassifier::fit(const tree_set_type& trees, const nuclearity_map_type& labels, const statistics_type& statistics)
  {
    if (trees.size() != labels.size())
      throw std::runtime_error("# of trees and # of nuclearity labels do not match");

    if (__strategy == most_frequent_by_rel && statistics.empty())
      throw configuration_error("no relation statistics for most_frequent_by_rel");
    if (__strategy == unamb_else_most_frequent && ! statistics.empty())
      throw configuration_error("relation statistics are not used by " + __name);

    configure(statistics);
  }

  void NuclearityClassifier::configure(const statistics_type& statistics)
  {
    __multinuclear.clear();

    switch (__strategy) {
    case unamb_else_most_frequent:
      __multinuclear.push_back("joint");
      __multinuclear.push_back("same-unit");
      __multinuclear.push_back("textual");
      break;
    case most_frequent_by_rel:
      __multinuclear = statistics.multinuclear();
      break;
    }

    std::sort(__multinuclear.begin(), __multinuclear.end());

    __fitted = true;

    if (debug) {
      std::cerr << "nuclearity: " << __name << " multinuclear:";
      for (label_set_type::const_iterator liter = __multinuclear.begin(); liter != __multinuclear.end(); ++ liter)
	std::cerr << ' ' << *liter;
      std::cerr << std::endl;
    }
  }

  void NuclearityClassifier::predict(const tree_type& tree, nuclearity_set_type& nuclearity) const
  {
    if (! __fitted)
      throw precondition_error("nuclearity classifier " + __name + " is not fitted");

    nuclearity.clear();
    nuclearity.reserve(tree.size());

    for (tree_type::size_type i = 0; i != tree.size(); ++ i) {
      if (i == 0)
	nuclearity.push_back(nuclearity_type::root);
      else if (std::binary_search(__multinuclear.begin(), __multinuclear.end(), tree.labels[i]))
	nuclearity.push_back(nuclearity_type::nucleus);
      else
	nuclearity.push_back(nuclearity_type::satellite);
    }
  }

  NuclearityClassifier::nuclearity_map_type NuclearityClassifier::predict(const tree_set_type& trees) const
  {
    nuclearity_map_type nuclearity(trees.size());

    for (size_type i = 0; i != trees.size(); ++ i)
      predict(trees[i], nuclearity[i]);

    return nuclearity;
  }

  void NuclearityClassifier::annotate(tree_type& tree, const bool overwrite) const
  {
    nuclearity_set_type predicted;
    predict(tree, predicted);

    if (overwrite || tree.nuclearity.size() != predicted.size())
      tree.nuclearity.swap(predicted);
    else
      for (tree_type::size_type i = 1; i != predicted.size(); ++ i)
	if (tree.nuclearity[i].empty())
	  tree.nuclearity[i] = predicted[i];
  }
};
