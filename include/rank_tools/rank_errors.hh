#ifndef __RANK_ERRORS_HH__
#define __RANK_ERRORS_HH__

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rank_tools {

// Graph source could not be opened or read.
class LoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Graph source was read but its contents are malformed.
class FormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Link counts and out-degrees disagree, or a node cannot be normalised.
class InvariantViolation : public std::logic_error {
public:
  InvariantViolation(size_t node, const std::string &what)
      : std::logic_error(what), node_(node) {}

  size_t Node() const { return node_; }

private:
  size_t node_;
};

} // namespace rank_tools

#endif
