// Numify Expression Compiler - IR Generation Helpers
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "codegen/ir/helpers.hpp"

#include <llvm/IR/Function.h>

#include <vector>

namespace numify {

IRHelpers::IRHelpers(llvm::LLVMContext& context,
                     llvm::Module& module,
                     llvm::IRBuilder<>& builder,
                     DiagnosticEngine& diags)
    : context_(context)
    , module_(module)
    , builder_(builder)
    , diags_(diags) {
  // Cache frequently used types
  voidType_ = llvm::Type::getVoidTy(context_);
  doubleType_ = llvm::Type::getDoubleTy(context_);
  int64Type_ = llvm::Type::getInt64Ty(context_);
  doublePtrType_ = llvm::PointerType::getUnqual(doubleType_);
  doublePtrPtrType_ = llvm::PointerType::getUnqual(doublePtrType_);
  int64PtrType_ = llvm::PointerType::getUnqual(int64Type_);
  int8PtrType_ = llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(context_));
  hostCallType_ = llvm::FunctionType::get(doubleType_,
                                          {int8PtrType_, int64Type_, doublePtrType_, int64Type_},
                                          false);
}

llvm::FunctionType* IRHelpers::kernelType() const {
  return llvm::FunctionType::get(voidType_,
                                 {int64Type_,
                                  doublePtrPtrType_,
                                  int64PtrType_,
                                  doublePtrType_,
                                  int8PtrType_,
                                  llvm::PointerType::getUnqual(hostCallType_)},
                                 false);
}

llvm::Constant* IRHelpers::constant(double value) {
  return llvm::ConstantFP::get(doubleType_, value);
}

llvm::Constant* IRHelpers::index(int64_t value) {
  return llvm::ConstantInt::get(int64Type_, value);
}

llvm::FunctionCallee IRHelpers::mathFunction(const std::string& name, unsigned arity) {
  std::vector<llvm::Type*> params(arity, doubleType_);
  llvm::FunctionType* type = llvm::FunctionType::get(doubleType_, params, false);
  llvm::FunctionCallee callee = module_.getOrInsertFunction(name, type);
  if (llvm::Function* F = llvm::dyn_cast<llvm::Function>(callee.getCallee())) {
    F->addFnAttr(llvm::Attribute::NoUnwind);
  }
  return callee;
}

llvm::Value* IRHelpers::loadInput(llvm::Value* inputs,
                                  llvm::Value* strides,
                                  unsigned slot,
                                  llvm::Value* index,
                                  const std::string& name) {
  llvm::Value* basePtr = builder_.CreateInBoundsGEP(doublePtrType_, inputs, this->index(slot));
  llvm::Value* base = builder_.CreateLoad(doublePtrType_, basePtr, name + ".base");
  llvm::Value* stridePtr = builder_.CreateInBoundsGEP(int64Type_, strides, this->index(slot));
  llvm::Value* stride = builder_.CreateLoad(int64Type_, stridePtr, name + ".stride");
  llvm::Value* offset = builder_.CreateMul(index, stride, name + ".offset");
  llvm::Value* element = builder_.CreateInBoundsGEP(doubleType_, base, offset);
  return builder_.CreateLoad(doubleType_, element, name);
}

llvm::AllocaInst* IRHelpers::createEntryAlloca(llvm::Type* type,
                                               unsigned count,
                                               const std::string& name) {
  llvm::Function* function = builder_.GetInsertBlock()->getParent();
  llvm::BasicBlock& entry = function->getEntryBlock();
  llvm::IRBuilder<> entryBuilder(&entry, entry.begin());
  return entryBuilder.CreateAlloca(type, index(count), name);
}

void IRHelpers::emitError(const std::string& message) {
  diags_.emitError("CodeGen: " + message);
}

}  // namespace numify
