// Numify Expression Compiler - IR Generation Helpers
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License
//
// Utility functions for IR generation
// Caches the kernel ABI types and declares C math-library functions

#pragma once

#include "codegen/support/diagnostics.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <string>

namespace numify {

// IR Generation Helper Functions
class IRHelpers {
public:
  IRHelpers(llvm::LLVMContext& context,
            llvm::Module& module,
            llvm::IRBuilder<>& builder,
            DiagnosticEngine& diags);

  // Kernel ABI types
  llvm::Type* voidType() const { return voidType_; }
  llvm::Type* doubleType() const { return doubleType_; }
  llvm::Type* int64Type() const { return int64Type_; }
  llvm::PointerType* doublePtrType() const { return doublePtrType_; }
  llvm::PointerType* doublePtrPtrType() const { return doublePtrPtrType_; }
  llvm::PointerType* int64PtrType() const { return int64PtrType_; }
  llvm::PointerType* int8PtrType() const { return int8PtrType_; }

  // double (i8* host, i64 index, double* argv, i64 argc)
  llvm::FunctionType* hostCallType() const { return hostCallType_; }

  // void (i64 n, double** inputs, i64* strides, double* out, i8* host, hostCall*)
  llvm::FunctionType* kernelType() const;

  llvm::Constant* constant(double value);
  llvm::Constant* index(int64_t value);

  // `double name(double, ...)` from the C math library, declared once per module
  llvm::FunctionCallee mathFunction(const std::string& name, unsigned arity);

  // Element `index` of input `slot`: inputs[slot][index * strides[slot]]
  llvm::Value* loadInput(llvm::Value* inputs,
                         llvm::Value* strides,
                         unsigned slot,
                         llvm::Value* index,
                         const std::string& name);

  // Stack slot in the entry block of the current function
  llvm::AllocaInst* createEntryAlloca(llvm::Type* type, unsigned count, const std::string& name);

  void emitError(const std::string& message);

private:
  llvm::LLVMContext& context_;
  llvm::Module& module_;
  llvm::IRBuilder<>& builder_;
  DiagnosticEngine& diags_;

  // Cached common types for efficient access
  llvm::Type* voidType_;
  llvm::Type* doubleType_;
  llvm::Type* int64Type_;
  llvm::PointerType* doublePtrType_;
  llvm::PointerType* doublePtrPtrType_;
  llvm::PointerType* int64PtrType_;
  llvm::PointerType* int8PtrType_;
  llvm::FunctionType* hostCallType_;
};

}  // namespace numify
