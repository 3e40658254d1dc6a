//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/JitOptions.hpp
// Purpose: Declares settings that influence JIT compilation.
// Key invariants: optLevel is clamped to [0, 3].
// Ownership/Lifetime: Value type; the trace stream is borrowed.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace cortado::jit
{

/// @brief Holds settings that control tracing, verification and optimization.
/// @invariant Flags are independent.
/// @ownership Value type.
struct JitOptions
{
    /// @brief Emit trace lines for each compile, block and instruction.
    bool trace = false;

    /// @brief Run the LLVM IR verifier before finalizing.
    bool verify = true;

    /// @brief Backend optimization pipeline level, 0 through 3.
    unsigned optLevel = 2;

    /// @brief Destination of trace lines; nullptr selects std::cerr.
    std::ostream *traceStream = nullptr;

    /// @brief Defaults overlaid with CORTADO_JIT_TRACE, CORTADO_JIT_VERIFY and
    ///        CORTADO_JIT_OPT from the process environment.
    static JitOptions fromEnvironment();
};

} // namespace cortado::jit
