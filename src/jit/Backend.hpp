//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Backend.hpp
// Purpose: Adapter over LLVM: native target setup, IR verification and
//          optimization, and finalization through ORC LLJIT.
// Key invariants: Target initialization happens at most once per process.
//                 Every llvm::Error is consumed and converted to an Error.
// Ownership/Lifetime: NativeCode owns the LLJIT instance, and with it the
//                     machine code its entry point refers to.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/Error.hpp"
#include "jit/JitOptions.hpp"
#include "jit/Value.hpp"

#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace cortado::jit
{

/// @brief Native calling convention of every compiled function.
/// @return TrapCode of the completion, 0 for a normal return.
using EntryPoint = int32_t (*)(const JitValue *args, size_t count, JitValue *result);

/// @brief Finalized machine code for one compiled function.
class NativeCode
{
  public:
    NativeCode(std::unique_ptr<llvm::orc::LLJIT> jit, EntryPoint entry);

    NativeCode(NativeCode &&) noexcept = default;
    NativeCode &operator=(NativeCode &&) noexcept = default;
    NativeCode(const NativeCode &) = delete;
    NativeCode &operator=(const NativeCode &) = delete;

    [[nodiscard]] EntryPoint entry() const
    {
        return entry_;
    }

  private:
    std::unique_ptr<llvm::orc::LLJIT> jit_;
    EntryPoint entry_;
};

/// @brief Initialize the host target exactly once.
/// @return UnsupportedTargetISA when the host has no LLVM backend.
Expected<void> initializeNativeTarget();

/// @brief Verify and optimize @p module, hand it to a fresh LLJIT and resolve
///        @p functionName.
/// @return ModuleError when verification fails; CodegenError for failures
///         reported by the JIT.
Expected<NativeCode> finalizeModule(llvm::orc::ThreadSafeModule module,
                                    const std::string &functionName,
                                    const JitOptions &options);

} // namespace cortado::jit
