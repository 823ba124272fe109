// Numify Expression Compiler - Codegen Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "codegen/ir/expr_gen.hpp"
#include "codegen/ir/helpers.hpp"
#include "codegen/support/diagnostics.hpp"
#include "compile/identifiers.hpp"
#include "expr/expr.hpp"

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <memory>
#include <string>
#include <vector>

namespace numify {

// Order of kernel inputs and host-callback slots
struct KernelLayout {
  CallSignature signature;             // inputs[0 .. signature.size())
  std::vector<Symbol> constants;       // inputs following the signature
  std::vector<std::string> functions;  // callHost index of each bound function
};

// LLVM code generator for vectorized kernels
class CodeGen {
private:
  // LLVM core components
  std::unique_ptr<llvm::LLVMContext> context_;
  std::unique_ptr<llvm::Module> module_;
  std::unique_ptr<llvm::IRBuilder<>> builder_;

  // Diagnostic engine for error reporting
  DiagnosticEngine& diags_;

  // Debug options
  bool debugMode_ = false;

  // Modular IR generation components
  IRHelpers irHelpers_;
  ExprGenerator exprGen_;

public:
  static constexpr const char* KERNEL_NAME = "kernel";

  CodeGen(const std::string& moduleName, DiagnosticEngine& diags);
  ~CodeGen();

  // Emit `kernel` computing expr element-wise; false after reporting errors
  bool compileKernel(const Expr& expr, const KernelLayout& layout);

  llvm::Module* getModule() { return module_.get(); }

  // Enable/disable debug mode
  void setDebugMode(bool enable) { debugMode_ = enable; }

  // Verify module IR, reporting failures as errors
  bool verifyModule();

  // Textual IR of the module
  std::string moduleText() const;

  // Hand the module and its context to the JIT; the generator is unusable afterwards
  std::unique_ptr<llvm::Module> takeModule();
  std::unique_ptr<llvm::LLVMContext> takeContext();

private:
  void emitError(const std::string& message);
};

// Optimization passes
class OptimizerPipeline {
public:
  static void optimize(llvm::Module* module, int optLevel);
};

}  // namespace numify
