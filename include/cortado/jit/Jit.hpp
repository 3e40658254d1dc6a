//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/cortado/jit/Jit.hpp
// Purpose: Stable public entry point for embedding the JIT in a VM.
// Key invariants: Re-exports only the compile/execute surface; CFG and
//                 translator internals stay under src/jit.
// Ownership/Lifetime: Types mirror definitions in cortado::jit and retain
//                     their semantics.
// Links: docs/codemap.md
#pragma once

#include "classfile/ClassFile.hpp"
#include "jit/Compiler.hpp"
#include "jit/Error.hpp"
#include "jit/Function.hpp"
#include "jit/JitOptions.hpp"
#include "jit/Runtime.hpp"
#include "jit/Signature.hpp"
#include "jit/Value.hpp"
