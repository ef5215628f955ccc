// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__TREE_BUILDER__HPP__
#define __DISCO__TREE_BUILDER__HPP__ 1

// dependency to constituency conversion
//
// A dependency edge src -r-> tgt is rotated into the binary node r(src, tgt), where the two
// antecedents are ordered by their text spans and src, the head side, is the nucleus.
// A head with dependents tgt1 .. tgtN, sorted by their ranks, is folded so that each dependent is
// attached to the tree already built from the head and its previous dependents:
//
//   rN(.. r2(r1(src, tgt1), tgt2) .., tgtN)
//
// The fold recurses as deep as the dependency tree. For pathologically deep trees walk() can be
// turned into a loop over an explicit stack of (node, accumulated parts, next dependent) frames,
// visiting the dependents in the same order.

#include <stdint.h>

#include <vector>

#include <disco/dependency_tree.hpp>
#include <disco/constituency_tree.hpp>

namespace disco
{
  class TreeBuilder
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef DependencyTree   dependency_type;
    typedef ConstituencyTree tree_type;

    typedef dependency_type::index_type      index_type;
    typedef dependency_type::index_set_type  index_set_type;
    typedef dependency_type::dependent_map_type dependent_map_type;
    typedef dependency_type::unit_type       unit_type;
    typedef dependency_type::span_type       span_type;
    typedef dependency_type::label_type      label_type;
    typedef dependency_type::nuclearity_type nuclearity_type;

    typedef tree_type::edu_span_type  edu_span_type;

    typedef std::vector<dependency_type, std::allocator<dependency_type> > dependency_set_type;
    typedef std::vector<tree_type, std::allocator<tree_type> >             tree_set_type;

  private:
    // partially built tree
    struct TreeParts
    {
      typedef tree_type::antecedent_type antecedent_type;

      TreeParts() : unit(), edu_span(), span(), relation(), antecedent() {}
      TreeParts(const unit_type& __unit)
	: unit(__unit), edu_span(__unit.index, __unit.index), span(__unit.span), relation(tree_type::leaf_label()), antecedent() {}

      void swap(TreeParts& x)
      {
	std::swap(unit, x.unit);
	std::swap(edu_span, x.edu_span);
	span.swap(x.span);
	relation.swap(x.relation);
	antecedent.swap(x.antecedent);
      }

      unit_type       unit;       // anchor
      edu_span_type   edu_span;
      span_type       span;
      label_type      relation;
      antecedent_type antecedent; // none or two
    };

  public:
    TreeBuilder(const int __debug = 0) : debug(__debug) {}

  public:
    // structural_error when the tree has no or multiple real roots, or spans overlap.
    // precondition_error when a node lacks nuclearity.
    void operator()(const dependency_type& source, tree_type& target) const;

    tree_type convert(const dependency_type& source) const
    {
      tree_type target;
      operator()(source, target);
      return target;
    }

    tree_set_type convert(const dependency_set_type& sources) const;

  private:
    void walk(const dependency_type& source, const dependent_map_type& dependents,
	      TreeParts* ancestor, const index_type node, TreeParts& parts) const;

    // src and tgt are consumed
    void connect(TreeParts& src, TreeParts& tgt, const label_type& relation, const nuclearity_type& nuclearity,
		 const index_type node, TreeParts& parts) const;

    // the antecedents of parts are swapped into target
    static void tree(const nuclearity_type& nuclearity, TreeParts& parts, tree_type& target);

  private:
    int debug;
  };
};

#endif
