// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__NUCLEARITY_CLASSIFIER__HPP__
#define __DISCO__NUCLEARITY_CLASSIFIER__HPP__ 1

// rule based nuclearity prediction.
// A dependent is a nucleus when its relation is multinuclear, otherwise a satellite.

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <disco/dependency_tree.hpp>
#include <disco/relation_statistics.hpp>

namespace disco
{
  class NuclearityClassifier
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef DependencyTree     tree_type;
    typedef RelationStatistics statistics_type;

    typedef tree_type::label_type          label_type;
    typedef tree_type::nuclearity_type     nuclearity_type;
    typedef tree_type::nuclearity_set_type nuclearity_set_type;

    typedef std::vector<tree_type, std::allocator<tree_type> >                     tree_set_type;
    typedef std::vector<nuclearity_set_type, std::allocator<nuclearity_set_type> > nuclearity_map_type;
    typedef std::vector<label_type, std::allocator<label_type> >                   label_set_type;

    typedef boost::filesystem::path path_type;

    typedef enum {
      unamb_else_most_frequent,
      most_frequent_by_rel,
    } strategy_type;

  public:
    // strategy name with an optional statistics=<file> for most_frequent_by_rel
    NuclearityClassifier(const std::string& parameter = "unamb_else_most_frequent", const int __debug = 0);

  public:
    static const char* lists();

    // configuration_error for an unknown name
    static strategy_type strategy(const std::string& name);

    void fit(const tree_set_type& trees, const nuclearity_map_type& labels);
    void fit(const tree_set_type& trees, const nuclearity_map_type& labels, const statistics_type& statistics);

    void predict(const tree_type& tree, nuclearity_set_type& nuclearity) const;

    nuclearity_set_type predict(const tree_type& tree) const
    {
      nuclearity_set_type nuclearity;
      predict(tree, nuclearity);
      return nuclearity;
    }

    nuclearity_map_type predict(const tree_set_type& trees) const;

    // store the prediction in tree. Without overwrite, only nodes lacking nuclearity are assigned
    void annotate(tree_type& tree, const bool overwrite = true) const;

    bool fitted() const { return __fitted; }
    strategy_type strategy() const { return __strategy; }
    const std::string& name() const { return __name; }

    // sorted
    const label_set_type& multinuclear() const { return __multinuclear; }

  private:
    void configure(const statistics_type& statistics);

  private:
    strategy_type  __strategy;
    std::string    __name;
    path_type      __statistics;
    label_set_type __multinuclear;
    bool           __fitted;

    int debug;
  };
};

#endif
