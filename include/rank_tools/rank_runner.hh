#ifndef __RANK_RUNNER_HH__
#define __RANK_RUNNER_HH__

#include "cli.hh"
#include <ostream>

namespace rank_tools {

// Load the graph named in the options, rank it with the selected algorithm
// and write the report to `out`.
// Propagates LoadError, FormatError, InvariantViolation and argument errors.
void RunRanking(const RankOptions &options, std::ostream &out);

} // namespace rank_tools

#endif
