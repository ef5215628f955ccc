// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__DEP2CON__HPP__
#define __DISCO__DEP2CON__HPP__ 1

// nuclearity prediction, attachment ranking and tree building in one step

#include <string>

#include <disco/dependency_tree.hpp>
#include <disco/constituency_tree.hpp>
#include <disco/nuclearity_classifier.hpp>
#include <disco/attachment_ranker.hpp>
#include <disco/tree_builder.hpp>

namespace disco
{
  class Dep2Con
  {
  public:
    typedef DependencyTree   dependency_type;
    typedef ConstituencyTree tree_type;

    typedef NuclearityClassifier classifier_type;
    typedef AttachmentRanker     ranker_type;
    typedef TreeBuilder          builder_type;

  public:
    // the classifier must be fitted before conversion
    Dep2Con(const classifier_type& __classifier,
	    const ranker_type& __ranker,
	    const bool __override_nuclearity = false,
	    const int __debug = 0)
      : classifier(__classifier),
	ranker(__ranker),
	builder(__debug),
	override_nuclearity(__override_nuclearity),
	debug(__debug) {}

  public:
    void operator()(const dependency_type& source, tree_type& target) const;

    tree_type operator()(const dependency_type& source) const
    {
      tree_type target;
      operator()(source, target);
      return target;
    }

  private:
    classifier_type classifier;
    ranker_type     ranker;
    builder_type    builder;

    bool override_nuclearity;
    int debug;
  };
};

#endif
