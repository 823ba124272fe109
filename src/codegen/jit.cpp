// Numify Expression Compiler - JIT Kernel
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "codegen/jit.hpp"

#include "error/errors.hpp"

#include <llvm/Config/llvm-config.h>
#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>

#include <mutex>

namespace numify {

namespace {

[[noreturn]] void fail(DiagnosticEngine& diags, const std::string& what, llvm::Error error) {
  std::string message = llvm::toString(std::move(error));
  diags.emitError("JIT: " + what + ": " + message);
  throw NumifyError(ErrorKind::CompilationFailed, what).setExplanation(message);
}

}  // namespace

void initializeNativeTarget() {
  static std::once_flag once;
  std::call_once(once, [] {
    llvm::InitializeNativeTarget();
    llvm::InitializeNativeTargetAsmPrinter();
    llvm::InitializeNativeTargetAsmParser();
  });
}

JitKernel::JitKernel(std::unique_ptr<llvm::orc::LLJIT> jit, KernelFn entry)
    : jit_(std::move(jit))
    , entry_(entry) {}

JitKernel::~JitKernel() = default;

std::unique_ptr<JitKernel> JitKernel::create(std::unique_ptr<llvm::Module> module,
                                             std::unique_ptr<llvm::LLVMContext> context,
                                             const char* entryName,
                                             DiagnosticEngine& diags) {
  initializeNativeTarget();

  auto jitOrErr = llvm::orc::LLJITBuilder().setNumCompileThreads(0).create();
  if (!jitOrErr) {
    fail(diags, "Failed to create LLJIT", jitOrErr.takeError());
  }
  std::unique_ptr<llvm::orc::LLJIT> jit = std::move(*jitOrErr);

  // Math-library calls resolve against the current process
  auto generator = llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(
      jit->getDataLayout().getGlobalPrefix());
  if (!generator) {
    fail(diags, "Failed to create symbol generator", generator.takeError());
  }
  jit->getMainJITDylib().addGenerator(std::move(*generator));

  module->setDataLayout(jit->getDataLayout());
  llvm::orc::ThreadSafeModule tsm(std::move(module), std::move(context));
  if (auto err = jit->addIRModule(std::move(tsm))) {
    fail(diags, "Failed to add module to JIT", std::move(err));
  }

  auto symbol = jit->lookup(entryName);
  if (!symbol) {
    fail(diags, "Failed to look up kernel", symbol.takeError());
  }

#if LLVM_VERSION_MAJOR >= 15
  auto entry = symbol->toPtr<KernelFn>();
#else
  auto entry = reinterpret_cast<KernelFn>(static_cast<uintptr_t>(symbol->getAddress()));
#endif

  return std::unique_ptr<JitKernel>(new JitKernel(std::move(jit), entry));
}

}  // namespace numify
