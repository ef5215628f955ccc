//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include "constituency_tree.hpp"

namespace disco
{
  const ConstituencyTree::label_type& ConstituencyTree::leaf_label()
  {
    static const label_type __label("leaf");
    return __label;
  }

  void ConstituencyTree::leaves(unit_set_type& units) const
  {
    if (leaf()) {
      if (! unit_.fake())
	units.push_back(unit_);
    } else
      for (const_iterator aiter = begin(); aiter != end(); ++ aiter)
	aiter->leaves(units);
  }

  ConstituencyTree::size_type ConstituencyTree::size() const
  {
    size_type num = 1;
    for (const_iterator aiter = begin(); aiter != end(); ++ aiter)
      num += aiter->size();
    return num;
  }

  ConstituencyTree::size_type ConstituencyTree::depth() const
  {
    size_type depth_max = 0;
    for (const_iterator aiter = begin(); aiter != end(); ++ aiter)
      depth_max = std::max(depth_max, aiter->depth());
    return depth_max + 1;
  }

  bool operator==(const ConstituencyTree& x, const ConstituencyTree& y)
  {
    return (x.nuclearity_.value == y.nuclearity_.value
	    && x.edu_span_ == y.edu_span_
	    && x.span_ == y.span_
	    && x.relation_ == y.relation_
	    && x.unit_ == y.unit_
	    && x.antecedent_ == y.antecedent_);
  }

  std::ostream& operator<<(std::ostream& os, const ConstituencyTree& x)
  {
    os << '(' << x.nuclearity_ << ':' << x.relation_
       << ' ' << x.edu_span_.first << '-' << x.edu_span_.second
       << ' ' << x.span_;

    for (ConstituencyTree::const_iterator aiter = x.begin(); aiter != x.end(); ++ aiter)
      os << ' ' << *aiter;

    os << ')';
    return os;
  }
};
