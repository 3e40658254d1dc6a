//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the control-flow builder, which splits a decoded method
// body into basic blocks and computes the operand-stack and local-slot shape
// every reachable block is entered with.
//
// Blocks live in a vector indexed by id, ordered by start pc. Entry shapes are
// fixed by a worklist dataflow over the whole method before translation, so a
// loop header knows its block parameters before any predecessor (including a
// back edge) is translated. Blocks that cannot be reached from pc 0 keep no
// shape and are never translated.
//
// An exception handler is reached through exceptional edges: every
// instruction that can trap inside a covered range, where the handler's
// catch type admits that trap, enters the handler with one Reference on the
// stack and the locals in effect before the instruction.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFile.hpp"
#include "jit/Error.hpp"
#include "jit/Runtime.hpp"
#include "jit/TypeStack.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cortado::jit
{

/// @brief Maximal straight-line run of instructions.
struct BasicBlock
{
    size_t id = 0;
    size_t startPc = 0;
    size_t endPc = 0; ///< One past the last instruction.
    std::vector<size_t> successors;   ///< Distinct successor ids.
    std::vector<size_t> predecessors; ///< Distinct predecessor ids, exceptional ones included.
    std::vector<size_t> exceptionSuccessors; ///< Handlers a trap in this block enters.
    bool handler = false;             ///< Starts an exception handler.
    bool reachable = false;
    StackShape entryStack;
    LocalShape entryLocals;
};

/// @brief Exception-table entry resolved against the block layout.
struct ExceptionHandler
{
    size_t startPc = 0;
    size_t endPc = 0; ///< Exclusive.
    size_t block = 0; ///< Id of the block at the handler pc.
    std::optional<std::string> catchClass; ///< Internal name; none catches everything.
};

/// @brief Runtime traps the lowering of @p op may raise.
std::vector<TrapCode> trapsRaisedBy(classfile::Opcode op);

/// @brief Finalized CFG of one method.
class ControlFlowGraph
{
  public:
    ControlFlowGraph() = default;
    ControlFlowGraph(std::vector<BasicBlock> blocks,
                     std::vector<size_t> order,
                     std::vector<ExceptionHandler> handlers);

    [[nodiscard]] const std::vector<BasicBlock> &blocks() const
    {
        return blocks_;
    }

    [[nodiscard]] const BasicBlock &block(size_t id) const
    {
        return blocks_[id];
    }

    /// @brief Id of the block starting exactly at @p pc.
    [[nodiscard]] std::optional<size_t> blockAt(size_t pc) const;

    /// @brief Reachable block ids in reverse postorder from the entry.
    [[nodiscard]] const std::vector<size_t> &translationOrder() const
    {
        return order_;
    }

    [[nodiscard]] const std::vector<ExceptionHandler> &handlers() const
    {
        return handlers_;
    }

    /// @brief Block of the first handler, in exception-table order, that
    ///        covers @p pc and catches @p code.
    [[nodiscard]] std::optional<size_t> handlerFor(size_t pc, TrapCode code) const;

  private:
    std::vector<BasicBlock> blocks_;
    std::vector<size_t> order_;
    std::vector<ExceptionHandler> handlers_;
};

/// @brief Builds a ControlFlowGraph from a Code attribute.
class ControlFlowBuilder
{
  public:
    ControlFlowBuilder(const classfile::CodeAttribute &code, const classfile::ConstantPool &pool);

    /// @brief Split into blocks and compute entry shapes.
    /// @param parameterLocals Local-slot kinds on method entry; must have
    ///        max_locals elements.
    /// @return InvalidBlockAddress for a branch or reachable fall-through
    ///         leaving the method or a malformed handler range;
    ///         ClassFileError for an unresolvable catch type; InternalError for disagreeing stack shapes at a merge
    ///         or a stack deeper than max_stack; instruction-level errors from
    ///         the dataflow pass.
    Expected<ControlFlowGraph> build(const LocalShape &parameterLocals) const;

  private:
    /// @brief Every pc control can transfer to from @p pc, in operand order.
    Expected<std::vector<size_t>> targetsOf(size_t pc) const;

    Expected<std::vector<bool>> findLeaders() const;

    Expected<std::vector<ExceptionHandler>> resolveHandlers(
        const std::vector<size_t> &blockOfPc) const;

    const classfile::CodeAttribute &code_;
    const classfile::ConstantPool &pool_;
};

} // namespace cortado::jit
