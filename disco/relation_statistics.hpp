// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__RELATION_STATISTICS__HPP__
#define __DISCO__RELATION_STATISTICS__HPP__ 1

// counts of nuclearity patterns, NN, NS and SN, for each relation label

#include <string>
#include <vector>
#include <map>
#include <iostream>

#include <boost/filesystem/path.hpp>

#include <disco/dependency_tree.hpp>

namespace disco
{
  class RelationStatistics
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    typedef double    count_type;

    typedef std::string label_type;
    typedef std::string pattern_type;

    typedef DependencyTree tree_type;

    typedef tree_type::nuclearity_set_type nuclearity_set_type;

    typedef std::vector<label_type, std::allocator<label_type> > label_set_type;

    typedef boost::filesystem::path path_type;

  private:
    // indexed as patterns()
    typedef std::vector<count_type, std::allocator<count_type> > count_set_type;
    typedef std::map<label_type, count_set_type, std::less<label_type>,
		     std::allocator<std::pair<const label_type, count_set_type> > > count_map_type;

  public:
    typedef count_map_type::const_iterator const_iterator;

  public:
    RelationStatistics() : counts() {}
    RelationStatistics(const path_type& path) : counts() { read(path); }

  public:
    // NN, NS, SN, in the order used to break ties
    static const label_set_type& patterns();

    void add(const label_type& relation, const pattern_type& pattern, const count_type& count = 1);

    // collect patterns from a tree and its gold nuclearity, which may be tree.nuclearity
    void collect(const tree_type& tree, const nuclearity_set_type& nuclearity);
    void collect(const tree_type& tree) { collect(tree, tree.nuclearity); }

    count_type count(const label_type& relation, const pattern_type& pattern) const;

    // the majority pattern, or an empty string for an unknown relation
    pattern_type most_frequent(const label_type& relation) const;

    // relations with NN as their majority pattern
    label_set_type multinuclear() const;

    const_iterator begin() const { return counts.begin(); }
    const_iterator end() const { return counts.end(); }

    size_type size() const { return counts.size(); }
    bool empty() const { return counts.empty(); }

    void clear() { counts.clear(); }

    void read(const path_type& path);

  public:
    // "relation pattern count" per line
    friend
    std::ostream& operator<<(std::ostream& os, const RelationStatistics& x);
    friend
    std::istream& operator>>(std::istream& is, RelationStatistics& x);

  private:
    count_map_type counts;
  };
};

#endif
