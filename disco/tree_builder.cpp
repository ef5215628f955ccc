//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>
#include <iostream>
#include <sstream>

#include <boost/lexical_cast.hpp>

#include "tree_builder.hpp"
#include "error.hpp"

namespace disco
{
  void TreeBuilder::operator()(const dependency_type& source, tree_type& target) const
  {
    const index_set_type roots = source.real_roots();

    if (roots.size() != 1) {
      std::ostringstream os;
      os << "cannot convert a dependency tree with " << roots.size() << " roots:";
      for (index_set_type::const_iterator riter = roots.begin(); riter != roots.end(); ++ riter)
	os << ' ' << *riter;

      throw structural_error(os.str(), roots.empty() ? index_type(-1) : roots.back());
    }

    source.verify();

    for (dependency_type::size_type i = 1; i != source.size(); ++ i)
      if (source.nuclearity[i].empty())
	throw precondition_error("no nuclearity for node " + boost::lexical_cast<std::string>(i));

    dependent_map_type dependents;
    source.dependents(dependents);

    TreeParts parts;
    walk(source, dependents, 0, roots.front(), parts);

    tree(nuclearity_type::root, parts, target);

    if (debug >= 2)
      std::cerr << "builder: " << target << std::endl;
  }

  TreeBuilder::tree_set_type TreeBuilder::convert(const dependency_set_type& sources) const
  {
    tree_set_type targets(sources.size());

    for (size_type i = 0; i != sources.size(); ++ i)
      operator()(sources[i], targets[i]);

    return targets;
  }

  // we look at three layers at the same time:
  //
  //            r0        r1
  //   ancestor --> node +--> tgt1
  //                     |r2
  //                     +--> tgt2 ..
  //
  // the tree of node is first folded with its dependents, then connected to the ancestor.
  void TreeBuilder::walk(const dependency_type& source, const dependent_map_type& dependents,
			 TreeParts* ancestor, const index_type node, TreeParts& parts) const
  {
    TreeParts src(source.units[node]);
    TreeParts folded;

    const index_set_type& deps = dependents[node];

    for (index_set_type::const_iterator diter = deps.begin(); diter != deps.end(); ++ diter) {
      walk(source, dependents, &src, *diter, folded);
      src.swap(folded);
    }

    // no ancestor for the root
    if (ancestor)
      connect(*ancestor, src, source.labels[node], source.nuclearity[node], node, parts);
    else
      parts.swap(src);
  }

  void TreeBuilder::connect(TreeParts& src, TreeParts& tgt, const label_type& relation, const nuclearity_type& nuclearity,
			    const index_type node, TreeParts& parts) const
  {
    if (src.span.overlaps(tgt.span)) {
      std::ostringstream os;
      os << "span " << src.span << " overlaps with " << tgt.span << " at node " << node;
      throw structural_error(os.str(), node);
    }

    parts.antecedent.resize(2);

    if (src.span <= tgt.span) {
      tree(nuclearity_type::nucleus, src, parts.antecedent.front());
      tree(nuclearity, tgt, parts.antecedent.back());
    } else {
      tree(nuclearity, tgt, parts.antecedent.front());
      tree(nuclearity_type::nucleus, src, parts.antecedent.back());
    }

    const edu_span_type& left  = parts.antecedent.front().edu_span();
    const edu_span_type& right = parts.antecedent.back().edu_span();

    parts.unit     = src.unit;
    parts.edu_span = edu_span_type(std::min(left.first, right.first), std::max(left.second, right.second));
    parts.span     = src.span.merge(tgt.span);
    parts.relation = relation;
  }

  void TreeBuilder::tree(const nuclearity_type& nuclearity, TreeParts& parts, tree_type& target)
  {
    if (parts.antecedent.empty())
      tree_type(nuclearity, parts.unit).swap(target);
    else {
      tree_type(nuclearity, parts.edu_span, parts.span, parts.relation, tree_type(), tree_type()).swap(target);

      target.left().swap(parts.antecedent.front());
      target.right().swap(parts.antecedent.back());
      parts.antecedent.clear();
    }
  }
};
