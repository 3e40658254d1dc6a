//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Trace.hpp
// Purpose: Declare tracing configuration and sink for JIT compilation steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink borrows its output stream.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/Instruction.hpp"
#include "jit/Error.hpp"
#include "jit/TypeStack.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace cortado::jit
{

struct BasicBlock;
struct JitOptions;

/// @brief Configuration for compilation tracing.
struct TraceConfig
{
    /// @brief Emit trace lines when set.
    bool enabled = false;

    /// @brief Destination stream; nullptr selects std::cerr.
    std::ostream *out = nullptr;

    /// @brief Derive from the trace fields of @p options.
    static TraceConfig fromOptions(const JitOptions &options);
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    [[nodiscard]] bool enabled() const
    {
        return cfg.enabled;
    }

    /// @brief Record the start of compiling @p function with @p signature.
    void onCompileStart(const std::string &function, const std::string &signature);

    /// @brief Record translation of @p block.
    void onBlock(const BasicBlock &block);

    /// @brief Record translation of @p instr at @p pc with @p depth values
    ///        on the operand stack beforehand.
    void onInstruction(size_t pc, const classfile::Instruction &instr, size_t depth);

    /// @brief Record successful completion.
    void onCompileFinish(const std::string &function);

    /// @brief Record failure with @p error.
    void onCompileFailed(const std::string &function, const Error &error);

  private:
    std::ostream &out();

    TraceConfig cfg; ///< Active configuration
};

} // namespace cortado::jit
