// Numify Expression Compiler - JIT Kernel Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "codegen/support/diagnostics.hpp"

#include <cstdint>
#include <memory>

namespace llvm {
class LLVMContext;
class Module;
namespace orc {
class LLJIT;
}
}  // namespace llvm

namespace numify {

// Callback for bound functions: (host frame, function index, argv, argc)
using HostCallFn = double (*)(void*, int64_t, const double*, int64_t);

// Compiled kernel entry point
using KernelFn = void (*)(int64_t n,
                          const double* const* inputs,
                          const int64_t* strides,
                          double* out,
                          void* host,
                          HostCallFn callHost);

// One JIT instance per kernel; the kernel can resolve nothing but C library symbols
class JitKernel {
public:
  // Takes ownership of the module and its context. Throws CompilationFailed.
  static std::unique_ptr<JitKernel> create(std::unique_ptr<llvm::Module> module,
                                           std::unique_ptr<llvm::LLVMContext> context,
                                           const char* entryName,
                                           DiagnosticEngine& diags);

  ~JitKernel();

  JitKernel(const JitKernel&) = delete;
  JitKernel& operator=(const JitKernel&) = delete;

  KernelFn entry() const { return entry_; }

private:
  JitKernel(std::unique_ptr<llvm::orc::LLJIT> jit, KernelFn entry);

  std::unique_ptr<llvm::orc::LLJIT> jit_;
  KernelFn entry_;
};

// Initialize the native target once per process
void initializeNativeTarget();

}  // namespace numify
