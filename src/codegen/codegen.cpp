// Numify Expression Compiler - Code Generator
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License
//
// Orchestration layer - builds the kernel loop and delegates expressions to ExprGenerator

#include "codegen/codegen.hpp"

#include <llvm/IR/Verifier.h>
#include <llvm/Passes/OptimizationLevel.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/raw_ostream.h>

#include <set>

namespace numify {

CodeGen::CodeGen(const std::string& moduleName, DiagnosticEngine& diags)
    : context_(std::make_unique<llvm::LLVMContext>())
    , module_(std::make_unique<llvm::Module>(moduleName, *context_))
    , builder_(std::make_unique<llvm::IRBuilder<>>(*context_))
    , diags_(diags)
    , irHelpers_(*context_, *module_, *builder_, diags_)
    , exprGen_(*context_, *module_, *builder_, irHelpers_) {}

CodeGen::~CodeGen() = default;

bool CodeGen::compileKernel(const Expr& expr, const KernelLayout& layout) {
  llvm::Function* kernel = llvm::Function::Create(irHelpers_.kernelType(),
                                                  llvm::Function::ExternalLinkage,
                                                  KERNEL_NAME,
                                                  module_.get());
  kernel->addFnAttr(llvm::Attribute::NoUnwind);

  auto arg = kernel->arg_begin();
  llvm::Value* n = &*arg++;
  llvm::Value* inputs = &*arg++;
  llvm::Value* strides = &*arg++;
  llvm::Value* out = &*arg++;
  llvm::Value* host = &*arg++;
  llvm::Value* callHost = &*arg++;
  n->setName("n");
  inputs->setName("inputs");
  strides->setName("strides");
  out->setName("out");
  host->setName("host");
  callHost->setName("callHost");

  HostCallContext hostCalls;
  hostCalls.host = host;
  hostCalls.callHost = callHost;
  for (size_t i = 0; i < layout.functions.size(); ++i) {
    hostCalls.functionIndex[layout.functions[i]] = static_cast<unsigned>(i);
  }
  exprGen_.setHostCalls(hostCalls);

  llvm::BasicBlock* entry = llvm::BasicBlock::Create(*context_, "entry", kernel);
  llvm::BasicBlock* header = llvm::BasicBlock::Create(*context_, "loop.header", kernel);
  llvm::BasicBlock* body = llvm::BasicBlock::Create(*context_, "loop.body", kernel);
  llvm::BasicBlock* exit = llvm::BasicBlock::Create(*context_, "loop.exit", kernel);

  // A constant expression is computed once and broadcast to every output slot
  bool constant = expr.isConstant();
  llvm::Value* hoisted = nullptr;

  builder_->SetInsertPoint(entry);
  if (constant) {
    exprGen_.resetSession();
    hoisted = exprGen_.genExpr(expr);
    if (!hoisted) {
      emitError("failed to generate constant expression");
      return false;
    }
  }
  builder_->CreateBr(header);

  builder_->SetInsertPoint(header);
  llvm::PHINode* index = builder_->CreatePHI(irHelpers_.int64Type(), 2, "i");
  index->addIncoming(irHelpers_.index(0), entry);
  llvm::Value* inRange = builder_->CreateICmpSLT(index, n, "inrange");
  builder_->CreateCondBr(inRange, body, exit);

  builder_->SetInsertPoint(body);
  llvm::Value* result = hoisted;
  if (!constant) {
    exprGen_.resetSession();
    std::set<Symbol> used = expr.freeSymbols();
    unsigned slot = 0;
    for (const auto& param : layout.signature) {
      if (used.count(param.symbol)) {
        exprGen_.bindSymbol(param.symbol,
                            irHelpers_.loadInput(inputs, strides, slot, index, param.identifier));
      }
      slot++;
    }
    for (const auto& symbol : layout.constants) {
      if (used.count(symbol)) {
        exprGen_.bindSymbol(symbol,
                            irHelpers_.loadInput(inputs, strides, slot, index, symbol.name()));
      }
      slot++;
    }
    result = exprGen_.genExpr(expr);
    if (!result) {
      emitError("failed to generate kernel body");
      return false;
    }
  }

  llvm::Value* target = builder_->CreateInBoundsGEP(irHelpers_.doubleType(), out, index);
  builder_->CreateStore(result, target);
  llvm::Value* next = builder_->CreateAdd(index, irHelpers_.index(1), "i.next");
  index->addIncoming(next, builder_->GetInsertBlock());
  builder_->CreateBr(header);

  builder_->SetInsertPoint(exit);
  builder_->CreateRetVoid();

  return verifyModule();
}

bool CodeGen::verifyModule() {
  std::string errorMsg;
  llvm::raw_string_ostream errorStream(errorMsg);

  if (llvm::verifyModule(*module_, &errorStream)) {
    emitError("Module verification failed:\n" + errorStream.str());
    return false;
  }

  if (debugMode_) {
    diags_.emitDebug("Module verified successfully");
  }

  return true;
}

std::string CodeGen::moduleText() const {
  std::string text;
  llvm::raw_string_ostream stream(text);
  module_->print(stream, nullptr);
  return stream.str();
}

std::unique_ptr<llvm::Module> CodeGen::takeModule() {
  builder_->ClearInsertionPoint();
  return std::move(module_);
}

std::unique_ptr<llvm::LLVMContext> CodeGen::takeContext() {
  return std::move(context_);
}

void CodeGen::emitError(const std::string& message) {
  diags_.emitError("CodeGen: " + message);
}

// Optimizer Pipeline

void OptimizerPipeline::optimize(llvm::Module* module, int optLevel) {
  if (optLevel <= 0)
    return;

  llvm::LoopAnalysisManager LAM;
  llvm::FunctionAnalysisManager FAM;
  llvm::CGSCCAnalysisManager CGAM;
  llvm::ModuleAnalysisManager MAM;

  llvm::PassBuilder PB;
  PB.registerModuleAnalyses(MAM);
  PB.registerCGSCCAnalyses(CGAM);
  PB.registerFunctionAnalyses(FAM);
  PB.registerLoopAnalyses(LAM);
  PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);

  llvm::ModulePassManager MPM;
  if (optLevel == 1)
    MPM = PB.buildPerModuleDefaultPipeline(llvm::OptimizationLevel::O1);
  else if (optLevel == 2)
    MPM = PB.buildPerModuleDefaultPipeline(llvm::OptimizationLevel::O2);
  else
    MPM = PB.buildPerModuleDefaultPipeline(llvm::OptimizationLevel::O3);

  MPM.run(*module, MAM);
}

}  // namespace numify
