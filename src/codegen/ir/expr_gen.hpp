// Numify Expression Compiler - Expression IR Generation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License
//
// Generates LLVM IR for expression trees over doubles

#pragma once

#include "codegen/ir/helpers.hpp"
#include "expr/expr.hpp"

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Value.h>

#include <map>
#include <string>
#include <unordered_map>

namespace numify {

// Host callback used for bound custom functions
struct HostCallContext {
  llvm::Value* host = nullptr;      // opaque frame pointer passed to the callback
  llvm::Value* callHost = nullptr;  // double (*)(i8*, i64, double*, i64)
  std::map<std::string, unsigned> functionIndex;
};

// Expression IR Generator
// Converts expression nodes to scalar double IR; identical subtrees are emitted once per session
class ExprGenerator {
public:
  ExprGenerator(llvm::LLVMContext& context,
                llvm::Module& module,
                llvm::IRBuilder<>& builder,
                IRHelpers& helpers);

  void setHostCalls(HostCallContext host) { host_ = std::move(host); }

  // Value of a symbol in the current session
  void bindSymbol(const Symbol& symbol, llvm::Value* value);

  // Forget symbol values and emitted subtrees (new basic-block scope)
  void resetSession();

  // Main expression dispatcher; returns nullptr after reporting an error
  llvm::Value* genExpr(const Expr& expr);

private:
  llvm::Value* genNumber(const Number& number);
  llvm::Value* genSymbol(const SymbolRef& ref);
  llvm::Value* genAdd(const Add& add);
  llvm::Value* genMul(const Mul& mul);
  llvm::Value* genPow(const Pow& pow);
  llvm::Value* genCall(const Call& call);
  llvm::Value* genApply(const Apply& apply);

  llvm::LLVMContext& context_;
  llvm::Module& module_;
  llvm::IRBuilder<>& builder_;
  IRHelpers& helpers_;

  HostCallContext host_;
  std::map<Symbol, llvm::Value*> symbols_;
  std::unordered_map<Expr, llvm::Value*, ExprHash> emitted_;
};

}  // namespace numify
