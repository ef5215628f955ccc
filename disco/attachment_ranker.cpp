//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>
#include <iostream>
#include <cstdlib>

#include <boost/lexical_cast.hpp>

#include "attachment_ranker.hpp"
#include "parameter.hpp"
#include "error.hpp"

namespace disco
{
  typedef AttachmentRanker::tree_type      tree_type;
  typedef AttachmentRanker::index_type     index_type;
  typedef AttachmentRanker::index_set_type index_set_type;

  namespace ranker
  {
    // textual position of a node. The fake root precedes every unit.
    inline
    index_type position(const tree_type& tree, const index_type node)
    {
      return (node == 0 ? index_type(-1) : tree.units[node].index);
    }

    struct less_position
    {
      less_position(const tree_type& __tree) : tree(__tree) {}

      bool operator()(const index_type& x, const index_type& y) const
      {
	if (x == 0 || y == 0)
	  return x == 0 && y != 0;
	return tree.units[x] < tree.units[y];
      }

      const tree_type& tree;
    };

    // The given order of the targets is kept as a sequence of left/right slots, each filled
    // by the nearest dependent not yet taken on that side. e.g. targets l3 r1 r3 l2 l1 r2 are
    // the slots L R R L L R, and yield l1 r1 r2 l2 l3 r3.
    void rank_id(const tree_type& tree, const index_type head, const index_set_type& targets,
		 index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      less_position less(tree);

      for (index_set_type::const_iterator titer = targets.begin(); titer != targets.end(); ++ titer) {
	index_set_type& side = (less(*titer, head) ? left : right);

	ordered.push_back(side.back());
	side.pop_back();
      }
    }

    void rank_lllrrr(const tree_type& tree, const index_type head, const index_set_type& targets,
		     index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      for (/**/; ! left.empty(); left.pop_back())
	ordered.push_back(left.back());
      for (/**/; ! right.empty(); right.pop_back())
	ordered.push_back(right.back());
    }

    void rank_rrrlll(const tree_type& tree, const index_type head, const index_set_type& targets,
		     index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_lllrrr(tree, head, targets, right, left, ordered);
    }

    void rank_lrlrlr(const tree_type& tree, const index_type head, const index_set_type& targets,
		     index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      while (! left.empty() || ! right.empty()) {
	if (! left.empty()) {
	  ordered.push_back(left.back());
	  left.pop_back();
	}
	if (! right.empty()) {
	  ordered.push_back(right.back());
	  right.pop_back();
	}
      }
    }

    void rank_rlrlrl(const tree_type& tree, const index_type head, const index_set_type& targets,
		     index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_lrlrlr(tree, head, targets, right, left, ordered);
    }

    // sort key of the closest-* strategies, compared lexicographically
    struct closest_key
    {
      int                sentence;  // 1 for intra-sentential, 2 for inter-sentential
      index_type         distance;
      int                direction; // 1 for the preferred side
      index_type         node;

      friend
      bool operator<(const closest_key& x, const closest_key& y)
      {
	return (x.sentence < y.sentence
		|| (!(y.sentence < x.sentence)
		    && (x.distance < y.distance
			|| (!(y.distance < x.distance)
			    && (x.direction < y.direction
				|| (!(y.direction < x.direction) && x.node < y.node))))));
      }
    };

    typedef std::vector<closest_key, std::allocator<closest_key> > closest_key_set_type;

    // preferred side, given whether the dependent is to the right and whether it is intra-sentential
    typedef bool (*prefer_type)(const bool is_right, const bool is_intra);

    inline bool prefer_left(const bool is_right, const bool is_intra) { return ! is_right; }
    inline bool prefer_right(const bool is_right, const bool is_intra) { return is_right; }
    inline bool prefer_right_intra_left_inter(const bool is_right, const bool is_intra) { return is_right == is_intra; }

    void rank_closest(const tree_type& tree, const index_type head, const index_set_type& targets,
		      const bool use_sentence, prefer_type prefer, index_set_type& ordered)
    {
      const index_type head_position = position(tree, head);
      const index_type head_sentence = tree.has_sentences() ? tree.sentences[head] : index_type(-1);

      closest_key_set_type keys;
      keys.reserve(targets.size());

      for (index_set_type::const_iterator titer = targets.begin(); titer != targets.end(); ++ titer) {
	const index_type target_position = position(tree, *titer);

	const bool is_right = target_position > head_position;
	const bool is_intra = use_sentence && head != 0 && tree.sentences[*titer] == head_sentence;

	closest_key key;
	key.sentence  = (use_sentence ? (is_intra ? 1 : 2) : 1);
	key.distance  = std::abs(target_position - head_position);
	key.direction = (prefer(is_right, is_intra) ? 1 : 2);
	key.node      = *titer;

	keys.push_back(key);
      }

      std::sort(keys.begin(), keys.end());

      for (closest_key_set_type::const_iterator kiter = keys.begin(); kiter != keys.end(); ++ kiter)
	ordered.push_back(kiter->node);
    }

    void rank_closest_lr(const tree_type& tree, const index_type head, const index_set_type& targets,
			 index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_closest(tree, head, targets, false, prefer_left, ordered);
    }

    void rank_closest_rl(const tree_type& tree, const index_type head, const index_set_type& targets,
			 index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_closest(tree, head, targets, false, prefer_right, ordered);
    }

    void rank_closest_intra_rl_inter_lr(const tree_type& tree, const index_type head, const index_set_type& targets,
					index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_closest(tree, head, targets, true, prefer_right_intra_left_inter, ordered);
    }

    void rank_closest_intra_rl_inter_rl(const tree_type& tree, const index_type head, const index_set_type& targets,
					index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_closest(tree, head, targets, true, prefer_right, ordered);
    }

    void rank_closest_intra_lr_inter_lr(const tree_type& tree, const index_type head, const index_set_type& targets,
					index_set_type& left, index_set_type& right, index_set_type& ordered)
    {
      rank_closest(tree, head, targets, true, prefer_left, ordered);
    }
  };

  const char* AttachmentRanker::lists()
  {
    static const char* desc = "\
id: keep the given left/right interleaving, inside-out on either side\n\
lllrrr: all left dependents, then all right dependents\n\
rrrlll: all right dependents, then all left dependents\n\
lrlrlr: alternate left and right, left first\n\
rlrlrl: alternate left and right, right first\n\
closest-lr: nearest first, left wins ties\n\
closest-rl: nearest first, right wins ties\n\
closest-intra-rl-inter-lr: intra-sentential first, nearest first, right wins intra ties, left wins inter ties\n\
closest-intra-rl-inter-rl: intra-sentential first, nearest first, right wins ties\n\
closest-intra-lr-inter-lr: intra-sentential first, nearest first, left wins ties\n\
";
    return desc;
  }

  AttachmentRanker::strategy_type AttachmentRanker::strategy(const std::string& name)
  {
    if (name == "id")
      return id;
    else if (name == "lllrrr")
      return lllrrr;
    else if (name == "rrrlll")
      return rrrlll;
    else if (name == "lrlrlr")
      return lrlrlr;
    else if (name == "rlrlrl")
      return rlrlrl;
    else if (name == "closest-lr")
      return closest_lr;
    else if (name == "closest-rl")
      return closest_rl;
    else if (name == "closest-intra-rl-inter-lr")
      return closest_intra_rl_inter_lr;
    else if (name == "closest-intra-rl-inter-rl")
      return closest_intra_rl_inter_rl;
    else if (name == "closest-intra-lr-inter-lr")
      return closest_intra_lr_inter_lr;
    else
      throw configuration_error("unknown attachment ranking strategy: " + name);
  }

  const char* AttachmentRanker::name(const strategy_type& strategy)
  {
    switch (strategy) {
    case id:                        return "id";
    case lllrrr:                    return "lllrrr";
    case rrrlll:                    return "rrrlll";
    case lrlrlr:                    return "lrlrlr";
    case rlrlrl:                    return "rlrlrl";
    case closest_lr:                return "closest-lr";
    case closest_rl:                return "closest-rl";
    case closest_intra_rl_inter_lr: return "closest-intra-rl-inter-lr";
    case closest_intra_rl_inter_rl: return "closest-intra-rl-inter-rl";
    case closest_intra_lr_inter_lr: return "closest-intra-lr-inter-lr";
    }
    return "unknown";
  }

  bool AttachmentRanker::sentential(const strategy_type& strategy)
  {
    return (strategy == closest_intra_rl_inter_lr
	    || strategy == closest_intra_rl_inter_rl
	    || strategy == closest_intra_lr_inter_lr);
  }

  AttachmentRanker::AttachmentRanker(const std::string& parameter, const int __debug)
    : __strategy(id), __rank(0), debug(__debug)
  {
    // no key is accepted
    const Parameter param(parameter);

    __strategy = strategy(param.name());

    switch (__strategy) {
    case id:                        __rank = ranker::rank_id; break;
    case lllrrr:                    __rank = ranker::rank_lllrrr; break;
    case rrrlll:                    __rank = ranker::rank_rrrlll; break;
    case lrlrlr:                    __rank = ranker::rank_lrlrlr; break;
    case rlrlrl:                    __rank = ranker::rank_rlrlrl; break;
    case closest_lr:                __rank = ranker::rank_closest_lr; break;
    case closest_rl:                __rank = ranker::rank_closest_rl; break;
    case closest_intra_rl_inter_lr: __rank = ranker::rank_closest_intra_rl_inter_lr; break;
    case closest_intra_rl_inter_rl: __rank = ranker::rank_closest_intra_rl_inter_rl; break;
    case closest_intra_lr_inter_lr: __rank = ranker::rank_closest_intra_lr_inter_lr; break;
    }
  }

  void AttachmentRanker::predict(const tree_type& tree, rank_set_type& ranks) const
  {
    typedef tree_type::dependent_map_type target_map_type;

    // heads are used as indices below
    tree.verify();

    if (sentential(__strategy) && ! tree.has_sentences())
      throw precondition_error(std::string("attachment ranking strategy ") + name()
			       + " depends on sentence ids, which are missing");

    ranks.clear();
    ranks.resize(tree.size(), 0);

    // dependents in node order
    target_map_type groups(tree.size());
    for (tree_type::size_type i = 1; i != tree.size(); ++ i)
      groups[tree.heads[i]].push_back(i);

    index_set_type sorted;
    index_set_type left;
    index_set_type right;
    index_set_type ordered;

    for (index_type head = 0; head != index_type(groups.size()); ++ head) {
      const index_set_type& targets = groups[head];

      if (targets.empty()) continue;

      sorted = targets;
      sorted.push_back(head);
      std::sort(sorted.begin(), sorted.end(), ranker::less_position(tree));

      const index_set_type::iterator centre = std::find(sorted.begin(), sorted.end(), head);

      // both are stacks, outside ... inside
      left.assign(sorted.begin(), centre);
      right.assign(sorted.rbegin(), index_set_type::reverse_iterator(centre + 1));

      ordered.clear();
      __rank(tree, head, targets, left, right, ordered);

      for (size_type i = 0; i != ordered.size(); ++ i)
	ranks[ordered[i]] = i;

      if (debug >= 2) {
	std::cerr << "ranker: " << name() << " head: " << head << " order:";
	for (index_set_type::const_iterator oiter = ordered.begin(); oiter != ordered.end(); ++ oiter)
	  std::cerr << ' ' << *oiter;
	std::cerr << std::endl;
      }
    }

    verify(tree, ranks);
  }

  AttachmentRanker::rank_map_type AttachmentRanker::predict(const tree_set_type& trees) const
  {
    rank_map_type ranks(trees.size());

    for (size_type i = 0; i != trees.size(); ++ i)
      predict(trees[i], ranks[i]);

    return ranks;
  }

  void AttachmentRanker::annotate(tree_type& tree) const
  {
    rank_set_type ranks;
    predict(tree, ranks);
    tree.ranks.swap(ranks);
  }

  void AttachmentRanker::verify(const tree_type& tree, const rank_set_type& ranks)
  {
    typedef std::vector<index_set_type, std::allocator<index_set_type> > group_set_type;

    if (ranks.size() != tree.size())
      throw invariant_violation("ranks do not match the tree size");

    group_set_type groups(tree.size());

    for (tree_type::size_type i = 1; i != tree.size(); ++ i) {
      const index_type head = tree.heads[i];

      if (head < 0 || head >= index_type(tree.size()))
	throw structural_error("head out of range for node " + boost::lexical_cast<std::string>(i), i);

      groups[head].push_back(ranks[i]);
    }

    for (size_type head = 0; head != groups.size(); ++ head) {
      index_set_type& group = groups[head];

      std::sort(group.begin(), group.end());

      for (size_type i = 0; i != group.size(); ++ i)
	if (group[i] != index_type(i))
	  throw invariant_violation("ranks of the dependents of " + boost::lexical_cast<std::string>(head)
				    + " are not a permutation", head);
    }
  }
};
