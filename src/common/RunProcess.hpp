//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare the blocking process execution helper used by build/run tasks.
// Key invariants: RunResult captures the exit code and the interleaved
//                 stdout/stderr bytes; launch failures never throw.
// Ownership/Lifetime: Callers own argument buffers; the helper owns every
//                     descriptor it opens and closes them before returning.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ite
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code = -1;   ///< Exit code, or -1 when the child never exited normally.
    std::string out;      ///< Captured standard output and standard error, interleaved.
    std::string err;      ///< Launch/wait failure description; empty on a normal exit.
    bool launched = false; ///< True once the program image was successfully executed.
    int term_signal = 0;  ///< Signal that terminated the child, or 0.
};

/// @brief Spawn a subprocess and block until it terminates.
/// @param argv Command-line arguments including the executable at index zero;
///        the executable is resolved through PATH.
/// @param cwd Optional working directory for the child; the parent's directory
///        is left untouched.
/// @return Captured process result. Standard input of the child is /dev/null.
RunResult run_process(const std::vector<std::string> &argv,
                      const std::optional<std::string> &cwd = std::nullopt);

} // namespace ite
