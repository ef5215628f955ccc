// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __DISCO__ERROR__HPP__
#define __DISCO__ERROR__HPP__ 1

// exceptions raised by the conversion pipeline

#include <stdint.h>

#include <stdexcept>
#include <string>

namespace disco
{
  // unknown strategy, malformed parameter
  struct configuration_error : public std::runtime_error
  {
    explicit configuration_error(const std::string& msg) : std::runtime_error(msg) {}
  };

  // the input lacks something the operation requires, such as sentence ids
  struct precondition_error : public std::runtime_error
  {
    explicit precondition_error(const std::string& msg) : std::runtime_error(msg) {}
  };

  // ill-formed dependency structure: number of roots, overlapping spans, cycles
  struct structural_error : public std::runtime_error
  {
    typedef int32_t index_type;

    structural_error(const std::string& msg, const index_type __node = -1)
      : std::runtime_error(msg), node(__node) {}

    index_type node;
  };

  struct invariant_violation : public std::logic_error
  {
    typedef int32_t index_type;

    invariant_violation(const std::string& msg, const index_type __head = -1)
      : std::logic_error(msg), head(__head) {}

    index_type head;
  };
};

#endif
