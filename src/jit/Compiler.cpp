//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Compiler.cpp
// Purpose: Drive name resolution, CFG construction, IR emission and backend
//          finalization for a single method.
// Key invariants: The emitted function has the EntryPoint signature
//                 i32 (i8* args, i64 count, i8* result). Arguments are read
//                 from 16-byte JitValue records and spilled to locals in the
//                 entry block, long and double taking two slots.
// Ownership/Lifetime: The LLVM context and module are owned by compile()
//                     until they move into the backend.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "jit/Compiler.hpp"

#include "jit/Backend.hpp"
#include "jit/ControlFlowBuilder.hpp"
#include "jit/InstructionTranslator.hpp"
#include "jit/LocalVariables.hpp"
#include "jit/Trace.hpp"

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <memory>

namespace cortado::jit
{
namespace
{

constexpr uint64_t kJitValueStride = sizeof(JitValue);
constexpr uint64_t kJitValuePayload = offsetof(JitValue, value);

/// Local-slot kinds on entry: parameters fill slots from 0, category 2 kinds
/// taking two.
Expected<LocalShape> parameterLocals(const Signature &signature, size_t maxLocals)
{
    if (signature.parameterSlots() > maxLocals)
    {
        return Error::make(ErrorKind::InvalidLocalVariableIndex,
                           "parameters need " + std::to_string(signature.parameterSlots()) +
                               " local slots but max_locals is " + std::to_string(maxLocals));
    }
    LocalShape locals(maxLocals);
    size_t slot = 0;
    for (Kind kind : signature.parameters)
    {
        const StackKind stackKind = *stackKindOf(kind);
        locals[slot] = stackKind;
        slot += isCategory2(stackKind) ? 2 : 1;
    }
    return locals;
}

/// Read argument @p index from the JitValue array and convert it to the IR
/// type of @p kind.
llvm::Value *loadArgument(llvm::IRBuilder<> &b, llvm::Value *args, size_t index, Kind kind)
{
    llvm::Value *address =
        b.CreateConstInBoundsGEP1_64(b.getInt8Ty(), args, index * kJitValueStride + kJitValuePayload);
    llvm::Value *raw =
        b.CreateLoad(b.getInt64Ty(), b.CreateBitCast(address, b.getInt64Ty()->getPointerTo()));
    switch (kind)
    {
        case Kind::Int32:
            return b.CreateTrunc(raw, b.getInt32Ty());
        case Kind::Float32:
            return b.CreateBitCast(b.CreateTrunc(raw, b.getInt32Ty()), b.getFloatTy());
        case Kind::Float64:
            return b.CreateBitCast(raw, b.getDoubleTy());
        case Kind::Int64:
        case Kind::Void:
            break;
    }
    return raw;
}

/// Emit the whole function body into @p module.
Expected<void> emitFunction(llvm::Module &module,
                            const std::string &name,
                            const Signature &signature,
                            const classfile::CodeAttribute &code,
                            const classfile::ConstantPool &pool,
                            const ControlFlowGraph &cfg,
                            TraceSink &trace)
{
    llvm::LLVMContext &context = module.getContext();
    llvm::Type *bytePtr = llvm::Type::getInt8PtrTy(context);
    llvm::FunctionType *type = llvm::FunctionType::get(
        llvm::Type::getInt32Ty(context), {bytePtr, llvm::Type::getInt64Ty(context), bytePtr}, false);
    llvm::Function *function =
        llvm::Function::Create(type, llvm::Function::ExternalLinkage, name, &module);
    llvm::Value *args = function->getArg(0);
    llvm::Value *result = function->getArg(2);
    args->setName("args");
    function->getArg(1)->setName("count");
    result->setName("result");

    llvm::BasicBlock *entry = llvm::BasicBlock::Create(context, "entry", function);
    llvm::IRBuilder<> builder(entry);
    LocalVariables locals(*function, code.maxLocals);

    size_t slot = 0;
    for (size_t i = 0; i < signature.parameters.size(); ++i)
    {
        const Kind kind = signature.parameters[i];
        const StackKind stackKind = *stackKindOf(kind);
        llvm::Value *value = loadArgument(builder, args, i, kind);
        if (auto r = locals.store(builder, static_cast<uint32_t>(slot), stackKind, value); !r)
            return r;
        slot += isCategory2(stackKind) ? 2 : 1;
    }

    // Declare every reachable block with its parameters before translating,
    // so back edges always find their target.
    std::vector<EmittedBlock> blocks(cfg.blocks().size());
    for (const BasicBlock &block : cfg.blocks())
    {
        if (!block.reachable)
            continue;
        EmittedBlock &emitted = blocks[block.id];
        emitted.block =
            llvm::BasicBlock::Create(context, "pc" + std::to_string(block.startPc), function);
        llvm::IRBuilder<> params(emitted.block);
        for (size_t i = 0; i < block.entryStack.size(); ++i)
        {
            emitted.params.push_back(params.CreatePHI(irType(context, block.entryStack[i]),
                                                      static_cast<unsigned>(block.predecessors.size()),
                                                      "s" + std::to_string(i)));
        }
    }
    builder.CreateBr(blocks[0].block);

    InstructionTranslator translator(
        TranslationContext{module, *function, builder, cfg, blocks, locals, code, pool, signature, result, trace});
    for (size_t id : cfg.translationOrder())
    {
        if (auto r = translator.translateBlock(id); !r)
            return r;
    }
    return {};
}

} // namespace

Compiler::Compiler(JitOptions options) : options_(options) {}

std::string Compiler::functionName(std::string_view className, std::string_view methodName)
{
    std::string name(className);
    for (char &c : name)
    {
        if (c == '/')
            c = '_';
    }
    if (methodName.size() >= 2 && methodName.front() == '<' && methodName.back() == '>')
        methodName = methodName.substr(1, methodName.size() - 2);
    name += "__";
    name += methodName;
    return name;
}

Expected<Function> Compiler::compile(const classfile::ClassFile &classFile,
                                     const classfile::Method &method) const
{
    if (auto r = initializeNativeTarget(); !r)
        return r.error();

    const auto &pool = classFile.constantPool;
    auto className = classFile.className();
    if (!className)
        return Error::fromClassFile(className.error());
    auto methodName = pool.tryGetUtf8(method.nameIndex);
    if (!methodName)
        return Error::fromClassFile(methodName.error());
    auto descriptor = pool.tryGetUtf8(method.descriptorIndex);
    if (!descriptor)
        return Error::fromClassFile(descriptor.error());

    const std::string qualified = className.value() + "." + methodName.value() + descriptor.value();
    if (!method.isStatic() && methodName.value() != "<init>")
    {
        return Error::make(ErrorKind::UnsupportedMethod,
                           "only static methods and <init> can be compiled: " + qualified);
    }
    if (!method.code)
        return Error::make(ErrorKind::UnsupportedMethod, "no Code attribute: " + qualified);
    const classfile::CodeAttribute &code = *method.code;

    auto signature = Signature::fromDescriptor(descriptor.value());
    if (!signature)
        return signature.error();

    for (size_t pc = 0; pc < code.code.size(); ++pc)
    {
        if (!isSupportedOpcode(code.code[pc].opcode))
        {
            return Error::make(ErrorKind::UnsupportedInstruction,
                               toString(code.code[pc]) + " at pc " + std::to_string(pc) + " in " +
                                   qualified);
        }
    }

    const std::string name = functionName(className.value(), methodName.value());
    TraceSink trace(TraceConfig::fromOptions(options_));
    trace.onCompileStart(name, signature.value().toString());

    auto fail = [&](Error error) -> Expected<Function>
    {
        trace.onCompileFailed(name, error);
        return error;
    };

    auto locals = parameterLocals(signature.value(), code.maxLocals);
    if (!locals)
        return fail(locals.error());
    auto cfg = ControlFlowBuilder(code, pool).build(locals.value());
    if (!cfg)
        return fail(cfg.error());

    auto context = std::make_unique<llvm::LLVMContext>();
    auto module = std::make_unique<llvm::Module>(name, *context);
    if (auto r = emitFunction(*module, name, signature.value(), code, pool, cfg.value(), trace); !r)
        return fail(r.error());

    auto native = finalizeModule(
        llvm::orc::ThreadSafeModule(std::move(module), std::move(context)), name, options_);
    if (!native)
        return fail(native.error());

    trace.onCompileFinish(name);
    return Function(name, std::move(signature.value()), std::move(native.value()));
}

} // namespace cortado::jit
