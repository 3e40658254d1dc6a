//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/ControlFlowBuilder.cpp
// Purpose: Leader scan, block partitioning, handler resolution, entry-shape
//          dataflow and reverse postorder for a single method body.
// Key invariants: Stack shapes at a merge agree slot for slot; local kinds
//                 only ever move towards "dead", so the worklist terminates.
// Ownership/Lifetime: The builder borrows the Code attribute and constant
//                     pool; the resulting graph owns its blocks.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "jit/ControlFlowBuilder.hpp"

#include <algorithm>
#include <deque>
#include <utility>

namespace cortado::jit
{

using classfile::Instruction;
using classfile::Opcode;

namespace
{

void addUnique(std::vector<size_t> &ids, size_t id)
{
    if (std::find(ids.begin(), ids.end(), id) == ids.end())
        ids.push_back(id);
}

Error invalidAddress(size_t pc, int64_t target)
{
    return Error::make(ErrorKind::InvalidBlockAddress,
                       "instruction " + std::to_string(pc) + " transfers control to invalid address " +
                           std::to_string(target));
}

std::optional<size_t> findHandler(const std::vector<ExceptionHandler> &handlers,
                                  size_t pc,
                                  TrapCode code)
{
    for (const ExceptionHandler &handler : handlers)
    {
        if (pc < handler.startPc || pc >= handler.endPc)
            continue;
        if (!handler.catchClass || isInstanceOf(code, *handler.catchClass))
            return handler.block;
    }
    return std::nullopt;
}

} // namespace

std::vector<TrapCode> trapsRaisedBy(Opcode op)
{
    switch (op)
    {
        case Opcode::Idiv:
        case Opcode::Ldiv:
        case Opcode::Irem:
        case Opcode::Lrem:
            return {TrapCode::ArithmeticException};
        case Opcode::Newarray:
            return {TrapCode::NegativeArraySizeException, TrapCode::OutOfMemoryError};
        case Opcode::Arraylength:
        case Opcode::Monitorenter:
        case Opcode::Monitorexit:
            return {TrapCode::NullPointerException};
        case Opcode::Iaload:
        case Opcode::Laload:
        case Opcode::Faload:
        case Opcode::Daload:
        case Opcode::Baload:
        case Opcode::Caload:
        case Opcode::Saload:
        case Opcode::Iastore:
        case Opcode::Lastore:
        case Opcode::Fastore:
        case Opcode::Dastore:
        case Opcode::Bastore:
        case Opcode::Castore:
        case Opcode::Sastore:
            return {TrapCode::NullPointerException, TrapCode::ArrayIndexOutOfBoundsException};
        default:
            return {};
    }
}

ControlFlowGraph::ControlFlowGraph(std::vector<BasicBlock> blocks,
                                   std::vector<size_t> order,
                                   std::vector<ExceptionHandler> handlers)
    : blocks_(std::move(blocks)), order_(std::move(order)), handlers_(std::move(handlers))
{
}

std::optional<size_t> ControlFlowGraph::handlerFor(size_t pc, TrapCode code) const
{
    return findHandler(handlers_, pc, code);
}

std::optional<size_t> ControlFlowGraph::blockAt(size_t pc) const
{
    auto it = std::lower_bound(blocks_.begin(),
                               blocks_.end(),
                               pc,
                               [](const BasicBlock &block, size_t value)
                               { return block.startPc < value; });
    if (it == blocks_.end() || it->startPc != pc)
        return std::nullopt;
    return it->id;
}

ControlFlowBuilder::ControlFlowBuilder(const classfile::CodeAttribute &code,
                                       const classfile::ConstantPool &pool)
    : code_(code), pool_(pool)
{
}

Expected<std::vector<size_t>> ControlFlowBuilder::targetsOf(size_t pc) const
{
    const Instruction &instr = code_.code[pc];
    const auto size = static_cast<int64_t>(code_.code.size());
    std::vector<int64_t> raw;

    if (classfile::isConditionalBranch(instr.opcode))
    {
        raw.push_back(instr.operand);
        raw.push_back(static_cast<int64_t>(pc) + 1);
    }
    else if (classfile::isUnconditionalBranch(instr.opcode))
    {
        raw.push_back(instr.operand);
    }
    else if (classfile::isSwitch(instr.opcode))
    {
        raw.push_back(static_cast<int64_t>(pc) + instr.switchDefault);
        for (int32_t offset : instr.switchOffsets)
            raw.push_back(static_cast<int64_t>(pc) + offset);
    }
    else if (!classfile::endsFallThrough(instr.opcode))
    {
        raw.push_back(static_cast<int64_t>(pc) + 1);
    }

    std::vector<size_t> targets;
    targets.reserve(raw.size());
    for (int64_t target : raw)
    {
        if (target < 0 || target >= size)
            return invalidAddress(pc, target);
        targets.push_back(static_cast<size_t>(target));
    }
    return targets;
}

Expected<std::vector<bool>> ControlFlowBuilder::findLeaders() const
{
    const size_t size = code_.code.size();
    std::vector<bool> leaders(size, false);
    leaders[0] = true;

    for (size_t pc = 0; pc < size; ++pc)
    {
        const Opcode op = code_.code[pc].opcode;
        const bool branch = classfile::isConditionalBranch(op) ||
                            classfile::isUnconditionalBranch(op) || classfile::isSwitch(op);
        if (branch)
        {
            // A bad target is reported once its block proves reachable.
            auto targets = targetsOf(pc);
            if (targets)
            {
                for (size_t target : targets.value())
                    leaders[target] = true;
            }
        }
        if ((branch || classfile::isReturn(op) || classfile::endsFallThrough(op)) && pc + 1 < size)
            leaders[pc + 1] = true;
    }

    for (const auto &entry : code_.exceptionTable)
    {
        if (entry.handlerPc >= size)
            return invalidAddress(entry.startPc, entry.handlerPc);
        leaders[entry.handlerPc] = true;
    }
    return leaders;
}

Expected<std::vector<ExceptionHandler>> ControlFlowBuilder::resolveHandlers(
    const std::vector<size_t> &blockOfPc) const
{
    const size_t size = code_.code.size();
    std::vector<ExceptionHandler> handlers;
    handlers.reserve(code_.exceptionTable.size());
    for (const auto &entry : code_.exceptionTable)
    {
        if (entry.startPc >= entry.endPc || entry.endPc > size)
        {
            return Error::make(ErrorKind::InvalidBlockAddress,
                               "exception range " + std::to_string(entry.startPc) + ".." +
                                   std::to_string(entry.endPc) + " lies outside the method");
        }
        ExceptionHandler handler;
        handler.startPc = entry.startPc;
        handler.endPc = entry.endPc;
        handler.block = blockOfPc[entry.handlerPc];
        if (entry.catchType != 0)
        {
            auto name = pool_.tryGetClassName(entry.catchType);
            if (!name)
                return Error::fromClassFile(name.error());
            handler.catchClass = std::move(name.value());
        }
        handlers.push_back(std::move(handler));
    }
    return handlers;
}

Expected<ControlFlowGraph> ControlFlowBuilder::build(const LocalShape &parameterLocals) const
{
    const size_t size = code_.code.size();
    if (size == 0)
        return Error::make(ErrorKind::InvalidBlockAddress, "method has no instructions");
    if (parameterLocals.size() != code_.maxLocals)
        return Error::internal("parameter local layout does not match max_locals");

    auto leaders = findLeaders();
    if (!leaders)
        return leaders.error();

    // Partition into blocks ordered by start pc.
    std::vector<BasicBlock> blocks;
    std::vector<size_t> blockOfPc(size, 0);
    for (size_t pc = 0; pc < size; ++pc)
    {
        if (leaders.value()[pc])
        {
            if (!blocks.empty())
                blocks.back().endPc = pc;
            BasicBlock block;
            block.id = blocks.size();
            block.startPc = pc;
            blocks.push_back(std::move(block));
        }
        blockOfPc[pc] = blocks.size() - 1;
    }
    blocks.back().endPc = size;

    auto handlers = resolveHandlers(blockOfPc);
    if (!handlers)
        return handlers.error();
    for (const ExceptionHandler &handler : handlers.value())
        blocks[handler.block].handler = true;

    // Edges out of a block that is never reached are never checked.
    std::vector<std::optional<Error>> edgeErrors(blocks.size());
    for (auto &block : blocks)
    {
        auto targets = targetsOf(block.endPc - 1);
        if (!targets)
        {
            edgeErrors[block.id] = targets.error();
            continue;
        }
        for (size_t target : targets.value())
            addUnique(block.successors, blockOfPc[target]);
    }

    // Entry-shape dataflow.
    std::deque<size_t> worklist;
    std::vector<bool> queued(blocks.size(), false);
    blocks[0].reachable = true;
    blocks[0].entryLocals = parameterLocals;
    worklist.push_back(0);
    queued[0] = true;

    auto enter = [&](size_t succId, const StackShape &shape, const LocalShape &locals) -> Expected<void>
    {
        BasicBlock &succ = blocks[succId];
        bool changed = false;
        if (!succ.reachable)
        {
            succ.reachable = true;
            succ.entryStack = shape;
            succ.entryLocals = locals;
            changed = true;
        }
        else
        {
            if (succ.entryStack != shape)
            {
                return Error::internal("operand stack mismatch entering pc " +
                                       std::to_string(succ.startPc) + ": " +
                                       toString(succ.entryStack) + " vs " + toString(shape));
            }
            for (size_t slot = 0; slot < locals.size(); ++slot)
            {
                if (succ.entryLocals[slot] && succ.entryLocals[slot] != locals[slot])
                {
                    succ.entryLocals[slot].reset();
                    changed = true;
                }
            }
        }
        if (changed && !queued[succId])
        {
            worklist.push_back(succId);
            queued[succId] = true;
        }
        return {};
    };

    const StackShape caught{StackKind::Reference};
    while (!worklist.empty())
    {
        const size_t id = worklist.front();
        worklist.pop_front();
        queued[id] = false;

        if (edgeErrors[id])
            return *edgeErrors[id];

        TypeStack stack(blocks[id].entryStack, code_.maxStack);
        LocalShape locals = blocks[id].entryLocals;
        for (size_t pc = blocks[id].startPc; pc < blocks[id].endPc; ++pc)
        {
            for (TrapCode trap : trapsRaisedBy(code_.code[pc].opcode))
            {
                auto handler = findHandler(handlers.value(), pc, trap);
                if (!handler)
                    continue;
                if (code_.maxStack < 1)
                {
                    return Error::internal("handler at pc " +
                                           std::to_string(blocks[*handler].startPc) +
                                           " needs a stack slot for the caught exception");
                }
                addUnique(blocks[id].exceptionSuccessors, *handler);
                if (auto r = enter(*handler, caught, locals); !r)
                    return r.error();
            }
            auto effect = applyStackEffect(code_.code[pc], pool_, stack, locals);
            if (!effect)
                return effect.error();
        }

        for (size_t succId : blocks[id].successors)
        {
            if (auto r = enter(succId, stack.shape(), locals); !r)
                return r.error();
        }
    }

    for (const auto &block : blocks)
    {
        if (!block.reachable)
            continue;
        for (size_t succ : block.successors)
            addUnique(blocks[succ].predecessors, block.id);
        for (size_t succ : block.exceptionSuccessors)
            addUnique(blocks[succ].predecessors, block.id);
    }

    // Reverse postorder over reachable blocks, exceptional edges after normal ones.
    std::vector<size_t> postorder;
    std::vector<bool> visited(blocks.size(), false);
    std::vector<std::pair<size_t, size_t>> dfs{{0, 0}};
    visited[0] = true;
    while (!dfs.empty())
    {
        auto &[id, next] = dfs.back();
        const BasicBlock &block = blocks[id];
        const size_t normal = block.successors.size();
        if (next < normal + block.exceptionSuccessors.size())
        {
            const size_t succ =
                next < normal ? block.successors[next] : block.exceptionSuccessors[next - normal];
            ++next;
            if (!visited[succ])
            {
                visited[succ] = true;
                dfs.emplace_back(succ, 0);
            }
            continue;
        }
        postorder.push_back(id);
        dfs.pop_back();
    }
    std::reverse(postorder.begin(), postorder.end());

    return ControlFlowGraph(std::move(blocks), std::move(postorder), std::move(handlers.value()));
}

} // namespace cortado::jit
