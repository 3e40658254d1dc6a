//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// LLVM backend glue. Each compiled function gets its own LLJIT instance so
// independent compiles share nothing but the process-wide target registry.
//
//===----------------------------------------------------------------------===//

#include "jit/Backend.hpp"

#include "jit/Runtime.hpp"

#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Passes/OptimizationLevel.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <mutex>

namespace cortado::jit
{
namespace
{

Error codegenError(llvm::Error err)
{
    return Error::fromBackend(ErrorKind::CodegenError, std::move(err));
}

llvm::OptimizationLevel optimizationLevel(unsigned level)
{
    switch (std::min(level, 3u))
    {
        case 1:
            return llvm::OptimizationLevel::O1;
        case 2:
            return llvm::OptimizationLevel::O2;
        default:
            return llvm::OptimizationLevel::O3;
    }
}

void optimizeModule(llvm::Module &module, unsigned level)
{
    if (level == 0)
        return;

    llvm::LoopAnalysisManager loops;
    llvm::FunctionAnalysisManager functions;
    llvm::CGSCCAnalysisManager cgscc;
    llvm::ModuleAnalysisManager modules;

    llvm::PassBuilder passes;
    passes.registerModuleAnalyses(modules);
    passes.registerCGSCCAnalyses(cgscc);
    passes.registerFunctionAnalyses(functions);
    passes.registerLoopAnalyses(loops);
    passes.crossRegisterProxies(loops, functions, cgscc, modules);

    llvm::ModulePassManager pipeline = passes.buildPerModuleDefaultPipeline(optimizationLevel(level));
    pipeline.run(module, modules);
}

} // namespace

NativeCode::NativeCode(std::unique_ptr<llvm::orc::LLJIT> jit, EntryPoint entry)
    : jit_(std::move(jit)), entry_(entry)
{
}

Expected<void> initializeNativeTarget()
{
    static std::once_flag once;
    static bool ready = false;
    std::call_once(once,
                   []
                   {
                       ready = !llvm::InitializeNativeTarget() &&
                               !llvm::InitializeNativeTargetAsmPrinter();
                   });
    if (!ready)
        return Error::make(ErrorKind::UnsupportedTargetISA, "no LLVM backend for the host target");
    return {};
}

Expected<NativeCode> finalizeModule(llvm::orc::ThreadSafeModule module,
                                    const std::string &functionName,
                                    const JitOptions &options)
{
    auto jit = llvm::orc::LLJITBuilder().create();
    if (!jit)
        return codegenError(jit.takeError());

    llvm::Module &ir = *module.getModuleUnlocked();
    ir.setDataLayout((*jit)->getDataLayout());
    ir.setTargetTriple((*jit)->getTargetTriple().str());

    if (options.verify)
    {
        std::string report;
        llvm::raw_string_ostream os(report);
        if (llvm::verifyModule(ir, &os))
        {
            return Error::fromBackend(
                ErrorKind::ModuleError,
                llvm::make_error<llvm::StringError>(os.str(), llvm::inconvertibleErrorCode()));
        }
    }

    optimizeModule(ir, options.optLevel);

    llvm::orc::JITDylib &main = (*jit)->getMainJITDylib();
    auto runtime = llvm::orc::absoluteSymbols(
        {{(*jit)->mangleAndIntern(kAllocateSymbol),
          llvm::JITEvaluatedSymbol::fromPointer(&cortado_jit_allocate)}});
    if (auto err = main.define(std::move(runtime)))
        return codegenError(std::move(err));

    // frem/drem lower to libm calls resolved from the host process.
    auto process = llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(
        (*jit)->getDataLayout().getGlobalPrefix());
    if (!process)
        return codegenError(process.takeError());
    main.addGenerator(std::move(*process));

    if (auto err = (*jit)->addIRModule(std::move(module)))
        return codegenError(std::move(err));

    auto symbol = (*jit)->lookup(functionName);
    if (!symbol)
        return codegenError(symbol.takeError());

    auto entry = llvm::jitTargetAddressToFunction<EntryPoint>(symbol->getAddress());
    return NativeCode(std::move(*jit), entry);
}

} // namespace cortado::jit
