// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__CONSTITUENCY_TREE__HPP__
#define __DISCO__CONSTITUENCY_TREE__HPP__ 1

// binary discourse constituency tree.
// A leaf holds exactly one unit, an internal node exactly two antecedents.

#include <stdint.h>

#include <string>
#include <vector>
#include <utility>
#include <iostream>

#include <disco/unit.hpp>
#include <disco/nuclearity.hpp>

namespace disco
{
  class ConstituencyTree
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    typedef int32_t   index_type;

    typedef Unit        unit_type;
    typedef Span        span_type;
    typedef Nuclearity  nuclearity_type;
    typedef std::string label_type;

    // inclusive range of unit indices
    typedef std::pair<index_type, index_type> edu_span_type;

    typedef ConstituencyTree tree_type;
    typedef std::vector<tree_type, std::allocator<tree_type> > antecedent_type;

    typedef antecedent_type::const_iterator const_iterator;
    typedef antecedent_type::iterator       iterator;

    typedef std::vector<unit_type, std::allocator<unit_type> > unit_set_type;

  public:
    ConstituencyTree() : nuclearity_(), edu_span_(-1, -1), span_(), relation_(), unit_(), antecedent_() {}

    // leaf
    ConstituencyTree(const nuclearity_type& nuclearity, const unit_type& unit)
      : nuclearity_(nuclearity),
	edu_span_(unit.index, unit.index),
	span_(unit.span),
	relation_(leaf_label()),
	unit_(unit),
	antecedent_() {}

    // binary node
    ConstituencyTree(const nuclearity_type& nuclearity,
		     const edu_span_type& edu_span,
		     const span_type& span,
		     const label_type& relation,
		     const tree_type& left,
		     const tree_type& right)
      : nuclearity_(nuclearity),
	edu_span_(edu_span),
	span_(span),
	relation_(relation),
	unit_(),
	antecedent_(2)
    {
      antecedent_.front() = left;
      antecedent_.back()  = right;
    }

  public:
    static const label_type& leaf_label();

    bool leaf() const { return antecedent_.empty(); }
    bool empty() const { return antecedent_.empty() && unit_.fake(); }

    const nuclearity_type& nuclearity() const { return nuclearity_; }
    const edu_span_type& edu_span() const { return edu_span_; }
    const span_type& span() const { return span_; }
    const label_type& relation() const { return relation_; }

    // valid only for a leaf
    const unit_type& unit() const { return unit_; }

    const tree_type& left() const { return antecedent_.front(); }
    const tree_type& right() const { return antecedent_.back(); }

    tree_type& left() { return antecedent_.front(); }
    tree_type& right() { return antecedent_.back(); }

    inline const_iterator begin() const { return antecedent_.begin(); }
    inline const_iterator end() const { return antecedent_.end(); }

    // units of the leaves, from left to right
    void leaves(unit_set_type& units) const;

    // number of nodes
    size_type size() const;

    // a leaf has depth 1
    size_type depth() const;

    void swap(ConstituencyTree& x)
    {
      std::swap(nuclearity_, x.nuclearity_);
      std::swap(edu_span_, x.edu_span_);
      span_.swap(x.span_);
      relation_.swap(x.relation_);
      std::swap(unit_, x.unit_);
      antecedent_.swap(x.antecedent_);
    }

  public:
    // (N:relation first-last span antecedents...)
    friend
    std::ostream& operator<<(std::ostream& os, const ConstituencyTree& x);

    friend
    bool operator==(const ConstituencyTree& x, const ConstituencyTree& y);

  private:
    nuclearity_type nuclearity_;
    edu_span_type   edu_span_;
    span_type       span_;
    label_type      relation_;
    unit_type       unit_;
    antecedent_type antecedent_;
  };

  inline
  bool operator!=(const ConstituencyTree& x, const ConstituencyTree& y)
  {
    return ! (x == y);
  }
};

namespace std
{
  inline
  void swap(disco::ConstituencyTree& x, disco::ConstituencyTree& y)
  {
    x.swap(y);
  }
};

#endif
