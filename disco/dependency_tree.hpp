// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__DEPENDENCY_TREE__HPP__
#define __DISCO__DEPENDENCY_TREE__HPP__ 1

// discourse dependency tree
//
// nodes are indexed 0..n, where node 0 is the fake root without any span.
// For node i > 0, heads[i] is its governor (0 for the real root), labels[i] the relation
// of the edge heads[i] -> i, nuclearity[i] its nuclearity (possibly none).
// sentences and ranks are optional annotations, present when sized as heads.

#include <stdint.h>

#include <string>
#include <vector>
#include <iostream>

#include <disco/unit.hpp>
#include <disco/nuclearity.hpp>
#include <disco/metadata.hpp>

namespace disco
{
  class DependencyTree
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    typedef int32_t   index_type;

    typedef Unit        unit_type;
    typedef Span        span_type;
    typedef std::string label_type;
    typedef Nuclearity  nuclearity_type;
    typedef Metadata    metadata_type;

    typedef std::vector<unit_type, std::allocator<unit_type> >             unit_set_type;
    typedef std::vector<index_type, std::allocator<index_type> >           index_set_type;
    typedef std::vector<label_type, std::allocator<label_type> >           label_set_type;
    typedef std::vector<nuclearity_type, std::allocator<nuclearity_type> > nuclearity_set_type;

    typedef std::vector<index_set_type, std::allocator<index_set_type> > dependent_map_type;

    typedef index_set_type head_set_type;
    typedef index_set_type rank_set_type;
    typedef index_set_type sentence_set_type;

  public:
    DependencyTree() { clear(); }

  public:
    // label of the edge into the fake root
    static const label_type& root_label();

    void clear();

    // the number of nodes including the fake root
    size_type size() const { return heads.size(); }
    bool empty() const { return heads.size() <= 1; }

    index_type add(const unit_type& unit,
		   const index_type head,
		   const label_type& label,
		   const nuclearity_type& nuc = nuclearity_type());
    index_type add(const unit_type& unit,
		   const index_type head,
		   const label_type& label,
		   const nuclearity_type& nuc,
		   const index_type sentence);

    bool has_sentences() const { return sentences.size() == heads.size(); }
    bool has_ranks() const { return ranks.size() == heads.size(); }

    // every real node carries nuclearity
    bool has_nuclearity() const;

    // nodes attached to the fake root
    index_set_type real_roots() const;

    // children of head, ordered by rank when ranked, else by node index
    void dependents(const index_type head, index_set_type& deps) const;

    index_set_type dependents(const index_type head) const
    {
      index_set_type deps;
      dependents(head, deps);
      return deps;
    }

    // children of every node at once, in the same order
    void dependents(dependent_map_type& deps) const;

    // heads in range, no self loop and no cycle, or structural_error
    void verify() const;

    void swap(DependencyTree& x)
    {
      units.swap(x.units);
      heads.swap(x.heads);
      labels.swap(x.labels);
      nuclearity.swap(x.nuclearity);
      sentences.swap(x.sentences);
      ranks.swap(x.ranks);
      metadata.swap(x.metadata);
    }

  public:
    // blank line separated blocks of "node first..last head label [nuclearity [sentence]]"
    // preceded by optional "# key = value" metadata lines
    friend
    std::ostream& operator<<(std::ostream& os, const DependencyTree& x);
    friend
    std::istream& operator>>(std::istream& is, DependencyTree& x);

  public:
    unit_set_type       units;
    head_set_type       heads;
    label_set_type      labels;
    nuclearity_set_type nuclearity;
    sentence_set_type   sentences;
    rank_set_type       ranks;

    metadata_type metadata;
  };
};

namespace std
{
  inline
  void swap(disco::DependencyTree& x, disco::DependencyTree& y)
  {
    x.swap(y);
  }
};

#endif
