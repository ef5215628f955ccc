// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__ATTACHMENT_RANKER__HPP__
#define __DISCO__ATTACHMENT_RANKER__HPP__ 1

// attachment ranking: for each head, a total order of its dependents which decides the order
// they are folded into the binary tree.
//
// Dependents of a head sit around it in the text:
//
//   lX .. l2 l1 h r1 r2 .. rY
//
// The left and right dependents are kept as stacks, (lX .. l1) and (rY .. r1), so that the one
// nearest to the head is popped first. Every strategy except the closest-* family pops from these
// stacks, hence yields an inside-out order on either side.

#include <stdint.h>

#include <string>
#include <vector>

#include <disco/dependency_tree.hpp>

namespace disco
{
  class AttachmentRanker
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef DependencyTree tree_type;

    typedef tree_type::index_type     index_type;
    typedef tree_type::index_set_type index_set_type;
    typedef tree_type::rank_set_type  rank_set_type;

    typedef std::vector<tree_type, std::allocator<tree_type> >         tree_set_type;
    typedef std::vector<rank_set_type, std::allocator<rank_set_type> > rank_map_type;

    typedef enum {
      id,
      lllrrr,
      rrrlll,
      lrlrlr,
      rlrlrl,
      closest_lr,
      closest_rl,
      closest_intra_rl_inter_lr,
      closest_intra_rl_inter_rl,
      closest_intra_lr_inter_lr,
    } strategy_type;

    // orders the dependents of a head.
    // targets are the dependents in node order, left and right the stacks described above.
    typedef void (*rank_function_type)(const tree_type& tree,
				       const index_type head,
				       const index_set_type& targets,
				       index_set_type& left,
				       index_set_type& right,
				       index_set_type& ordered);

  public:
    AttachmentRanker(const std::string& parameter = "id", const int __debug = 0);

  public:
    static const char* lists();

    // configuration_error for an unknown name
    static strategy_type strategy(const std::string& name);
    static const char* name(const strategy_type& strategy);

    // does the strategy depend on sentence ids?
    static bool sentential(const strategy_type& strategy);

    // ranks for every node, 0 for the fake root
    void predict(const tree_type& tree, rank_set_type& ranks) const;

    rank_set_type predict(const tree_type& tree) const
    {
      rank_set_type ranks;
      predict(tree, ranks);
      return ranks;
    }

    rank_map_type predict(const tree_set_type& trees) const;

    // store ranks in tree
    void annotate(tree_type& tree) const;

    // ranks of every sibling group form a permutation of 0..k-1, else invariant_violation
    static void verify(const tree_type& tree, const rank_set_type& ranks);

    strategy_type strategy() const { return __strategy; }
    const char* name() const { return name(__strategy); }

  private:
    strategy_type      __strategy;
    rank_function_type __rank;

    int debug;
  };
};

#endif
