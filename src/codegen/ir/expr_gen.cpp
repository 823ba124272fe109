// Numify Expression Compiler - Expression IR Generation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "codegen/ir/expr_gen.hpp"

#include <cmath>
#include <type_traits>

namespace numify {

ExprGenerator::ExprGenerator(llvm::LLVMContext& context,
                             llvm::Module& module,
                             llvm::IRBuilder<>& builder,
                             IRHelpers& helpers)
    : context_(context)
    , module_(module)
    , builder_(builder)
    , helpers_(helpers) {}

void ExprGenerator::bindSymbol(const Symbol& symbol, llvm::Value* value) {
  symbols_[symbol] = value;
}

void ExprGenerator::resetSession() {
  symbols_.clear();
  emitted_.clear();
}

llvm::Value* ExprGenerator::genExpr(const Expr& expr) {
  auto cached = emitted_.find(expr);
  if (cached != emitted_.end()) {
    return cached->second;
  }

  llvm::Value* value = std::visit(
      [this](auto&& node) -> llvm::Value* {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Number>) {
          return genNumber(node);
        } else if constexpr (std::is_same_v<T, SymbolRef>) {
          return genSymbol(node);
        } else if constexpr (std::is_same_v<T, Add>) {
          return genAdd(node);
        } else if constexpr (std::is_same_v<T, Mul>) {
          return genMul(node);
        } else if constexpr (std::is_same_v<T, Pow>) {
          return genPow(node);
        } else if constexpr (std::is_same_v<T, Call>) {
          return genCall(node);
        } else if constexpr (std::is_same_v<T, Apply>) {
          return genApply(node);
        } else {
          helpers_.emitError("Unknown expression type");
          return nullptr;
        }
      },
      expr.node().node);

  if (value) {
    emitted_.emplace(expr, value);
  }
  return value;
}

llvm::Value* ExprGenerator::genNumber(const Number& number) {
  return helpers_.constant(number.value);
}

llvm::Value* ExprGenerator::genSymbol(const SymbolRef& ref) {
  auto it = symbols_.find(ref.symbol);
  if (it == symbols_.end()) {
    helpers_.emitError("Undefined symbol: " + ref.symbol.toString());
    return nullptr;
  }
  return it->second;
}

llvm::Value* ExprGenerator::genAdd(const Add& add) {
  llvm::Value* sum = nullptr;
  for (const auto& term : add.terms) {
    llvm::Value* value = genExpr(term);
    if (!value) {
      return nullptr;
    }
    sum = sum ? builder_.CreateFAdd(sum, value, "addtmp") : value;
  }
  return sum;
}

llvm::Value* ExprGenerator::genMul(const Mul& mul) {
  llvm::Value* product = nullptr;
  for (const auto& factor : mul.factors) {
    auto coefficient = factor.numberValue();
    if (coefficient && *coefficient == -1.0 && product) {
      product = builder_.CreateFNeg(product, "negtmp");
      continue;
    }
    llvm::Value* value = genExpr(factor);
    if (!value) {
      return nullptr;
    }
    product = product ? builder_.CreateFMul(product, value, "multmp") : value;
  }
  return product;
}

llvm::Value* ExprGenerator::genPow(const Pow& pow) {
  llvm::Value* base = genExpr(pow.operands[0]);
  if (!base) {
    return nullptr;
  }

  // Small integral exponents become multiplications
  auto exponent = pow.operands[1].numberValue();
  if (exponent && std::fabs(*exponent) <= 4.0 && *exponent == std::floor(*exponent) &&
      *exponent != 0.0) {
    llvm::Value* result = base;
    for (int i = 1; i < static_cast<int>(std::fabs(*exponent)); ++i) {
      result = builder_.CreateFMul(result, base, "powtmp");
    }
    if (*exponent < 0) {
      result = builder_.CreateFDiv(helpers_.constant(1.0), result, "invtmp");
    }
    return result;
  }
  if (exponent && *exponent == 0.5) {
    return builder_.CreateCall(helpers_.mathFunction("sqrt", 1), {base}, "sqrttmp");
  }

  llvm::Value* power = genExpr(pow.operands[1]);
  if (!power) {
    return nullptr;
  }
  return builder_.CreateCall(helpers_.mathFunction("pow", 2), {base, power}, "powtmp");
}

llvm::Value* ExprGenerator::genCall(const Call& call) {
  std::vector<llvm::Value*> args;
  for (const auto& arg : call.args) {
    llvm::Value* value = genExpr(arg);
    if (!value) {
      return nullptr;
    }
    args.push_back(value);
  }

  // C math-library names; abs maps to fabs
  std::string name = call.fn == Builtin::Abs ? "fabs" : builtinName(call.fn);
  return builder_.CreateCall(helpers_.mathFunction(name, static_cast<unsigned>(args.size())),
                             args,
                             name + "tmp");
}

llvm::Value* ExprGenerator::genApply(const Apply& apply) {
  auto index = host_.functionIndex.find(apply.fn->name);
  if (index == host_.functionIndex.end() || !host_.callHost) {
    helpers_.emitError("No binding for function: " + apply.fn->name);
    return nullptr;
  }

  // Arguments are passed through a stack array
  unsigned argc = static_cast<unsigned>(apply.args.size());
  llvm::AllocaInst* argv =
      helpers_.createEntryAlloca(helpers_.doubleType(), argc == 0 ? 1 : argc, apply.fn->name + ".argv");
  for (unsigned i = 0; i < argc; ++i) {
    llvm::Value* value = genExpr(apply.args[i]);
    if (!value) {
      return nullptr;
    }
    llvm::Value* slot = builder_.CreateInBoundsGEP(helpers_.doubleType(), argv, helpers_.index(i));
    builder_.CreateStore(value, slot);
  }

  return builder_.CreateCall(helpers_.hostCallType(),
                             host_.callHost,
                             {host_.host, helpers_.index(index->second), argv, helpers_.index(argc)},
                             apply.fn->name + "tmp");
}

}  // namespace numify
