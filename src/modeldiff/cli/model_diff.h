#ifndef MODELDIFF_CLI_MODEL_DIFF_H
#define MODELDIFF_CLI_MODEL_DIFF_H

#include <ostream>

namespace modeldiff {

// Run the model-diff command-line tool with the given arguments (including
// the program name in argv[0]). The report goes to :out and diagnostics go
// to :err.
//
// The return value is the process exit code: 0 on success, 1 for usage
// errors, and 2 if the configuration file can't be read or is invalid.
int
run_model_diff(
    int argc, char const* const* argv, std::ostream& out, std::ostream& err);

} // namespace modeldiff

#endif
