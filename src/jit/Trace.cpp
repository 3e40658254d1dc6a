//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Trace.cpp
// Purpose: Implement formatting of compilation trace lines.
// Key invariants: Each event produces exactly one line prefixed with
//                 "[JIT]"; a disabled sink writes nothing.
// Ownership/Lifetime: Sink does not own the stream it writes to.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "jit/Trace.hpp"

#include "jit/ControlFlowBuilder.hpp"
#include "jit/JitOptions.hpp"

#include <iostream>

namespace cortado::jit
{

TraceConfig TraceConfig::fromOptions(const JitOptions &options)
{
    TraceConfig cfg;
    cfg.enabled = options.trace;
    cfg.out = options.traceStream;
    return cfg;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::out()
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onCompileStart(const std::string &function, const std::string &signature)
{
    if (!cfg.enabled)
        return;
    out() << "[JIT] compile " << function << ' ' << signature << '\n';
}

void TraceSink::onBlock(const BasicBlock &block)
{
    if (!cfg.enabled)
        return;
    out() << "[JIT] block " << block.id << " pc " << block.startPc << ".." << block.endPc
          << " stack " << toString(block.entryStack) << '\n';
}

void TraceSink::onInstruction(size_t pc, const classfile::Instruction &instr, size_t depth)
{
    if (!cfg.enabled)
        return;
    out() << "[JIT]   " << pc << ": " << classfile::toString(instr) << " depth=" << depth << '\n';
}

void TraceSink::onCompileFinish(const std::string &function)
{
    if (!cfg.enabled)
        return;
    out() << "[JIT] done " << function << '\n';
}

void TraceSink::onCompileFailed(const std::string &function, const Error &error)
{
    if (!cfg.enabled)
        return;
    out() << "[JIT] failed " << function << ": " << error << '\n';
}

} // namespace cortado::jit
