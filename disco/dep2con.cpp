//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iostream>

#include "dep2con.hpp"

#include "utils/resource.hpp"

namespace disco
{
  void Dep2Con::operator()(const dependency_type& source, tree_type& target) const
  {
    const std::string& id = source.metadata.get("id");

    if (debug)
      std::cerr << "dep2con: " << id << " # of units: " << (source.size() - 1) << std::endl;

    utils::resource start;

    dependency_type dependency(source);

    if (override_nuclearity || ! dependency.has_nuclearity())
      classifier.annotate(dependency, override_nuclearity);

    ranker.annotate(dependency);

    builder(dependency, target);

    utils::resource end;

    if (debug)
      std::cerr << "dep2con: " << id
		<< " cpu time: " << (end.cpu_time() - start.cpu_time())
		<< " user time: " << (end.user_time() - start.user_time())
		<< std::endl;

    if (debug)
      std::cerr << "dep2con: " << id
		<< " # of nodes: " << target.size()
		<< " depth: " << target.depth()
		<< std::endl;
  }
};
