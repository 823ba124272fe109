// Numify Expression Compiler - Compiler
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/compiler.hpp"

#include "codegen/codegen.hpp"
#include "codegen/jit.hpp"
#include "compile/identifiers.hpp"
#include "error/errors.hpp"
#include "expr/printer.hpp"
#include "expr/rewrite.hpp"

#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>

namespace numify {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point from, Clock::time_point to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

// Readable C++ rendition of the generated kernel
std::string renderSource(const std::string& body,
                         const CallSignature& signature,
                         const std::vector<std::pair<Symbol, std::string>>& constants,
                         bool vectorize,
                         bool broadcastConstant) {
  std::vector<std::string> args;
  for (const auto& entry : signature) {
    args.push_back(entry.identifier);
  }

  std::ostringstream oss;
  oss << "NumericValue kernel(";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << "NumericValue " << args[i];
  }
  oss << ") {\n";
  if (vectorize) {
    for (const auto& arg : args) {
      oss << "  " << arg << " = array::asarray(" << arg << ");\n";
    }
  }
  for (const auto& [symbol, identifier] : constants) {
    oss << "  const NumericValue " << identifier << " = _consts.at(\"" << symbol.toString()
        << "\");\n";
  }
  if (broadcastConstant) {
    oss << "  Shape _shape = array::broadcastShape({";
    for (size_t i = 0; i < args.size(); ++i) {
      if (i > 0)
        oss << ", ";
      oss << "&" << args[i];
    }
    oss << "});\n";
    oss << "  return (" << body << ") + array::zerosLike(_shape);\n";
  } else {
    oss << "  return " << body << ";\n";
  }
  oss << "}\n";
  return oss.str();
}

}  // namespace

Compiler::Compiler(CompilationCache* cache, DiagnosticEngine* diags)
    : cache_(cache)
    , ownedDiags_(diags ? nullptr : std::make_unique<DiagnosticEngine>())
    , diags_(diags ? diags : ownedDiags_.get()) {}

NumericFunction Compiler::compile(const Expr& expr,
                                  const VarSpec& vars,
                                  const Bindings& bindings,
                                  const CompileOptions& options) {
  return NumericFunction(compileArtifact(expr, vars, bindings, options), vars);
}

NumericFunction Compiler::compileInferred(const Expr& expr,
                                          const Bindings& bindings,
                                          const CompileOptions& options) {
  Expr source = options.expandDefinition
                    ? rewriteToFixedPoint(expr, options.maxRewritePasses).expr
                    : expr;

  std::set<Symbol> bound;
  for (const auto& [key, value] : bindings) {
    if (auto* keyExpr = std::get_if<Expr>(&key)) {
      if (const Symbol* symbol = keyExpr->asSymbol()) {
        if (std::holds_alternative<NumericValue>(value)) {
          bound.insert(*symbol);
        }
      }
    }
  }

  VarSpec inferredSpec = VarSpec::inferred(source);
  std::vector<Symbol> free;
  for (const auto& symbol : inferredSpec.all()) {
    if (!bound.count(symbol)) {
      free.push_back(symbol);
    }
  }
  return compile(expr, VarSpec::sequence(free), bindings, options);
}

ArtifactPtr Compiler::compileArtifact(const Expr& expr,
                                      const VarSpec& vars,
                                      const Bindings& bindings,
                                      const CompileOptions& options) {
  if (options.optLevel < 0 || options.optLevel > 3) {
    throw NumifyError(ErrorKind::InvalidSpec, "Optimization level out of range")
        .setExplanation("expected 0-3, got " + std::to_string(options.optLevel));
  }

  if (!cache_ || !options.cache) {
    return build(expr, vars, bindings, options);
  }

  CacheKey key = CacheKey::make(expr, vars, bindings, options);
  bool hit = cache_->contains(key);
  ArtifactPtr artifact =
      cache_->getOrCompile(key, [&]() { return build(expr, vars, bindings, options); });
  diags_->emitDebug(std::string("cache ") + (hit ? "hit" : "miss") + " for " + expr.toString() +
                    " with vars " + vars.toString());
  return artifact;
}

ArtifactPtr Compiler::build(const Expr& expr,
                            const VarSpec& vars,
                            const Bindings& bindings,
                            const CompileOptions& options) {
  auto start = Clock::now();
  diags_->emitDebug("compiling " + expr.toString() + " with vars " + vars.toString());

  // Definitions
  Expr target = expr;
  if (options.expandDefinition) {
    RewriteResult rewritten = rewriteToFixedPoint(expr, options.maxRewritePasses);
    if (!rewritten.converged) {
      diags_->emitWarning("definition expansion stopped after " +
                          std::to_string(rewritten.passes) +
                          " passes without reaching a fixed point");
    }
    target = rewritten.expr;
  }
  auto rewrote = Clock::now();

  // Bindings and validation
  BindingSet resolved = resolveBindings(target, bindings);
  checkSymbolCoverage(target, vars, resolved);
  requireBoundFunctions(target, resolved);

  // Identifiers: signature first, then constants, then bound functions
  IdentifierAllocator allocator;
  CallSignature signature = allocateSignature(vars, allocator);

  std::map<Symbol, std::string> identifiers;
  for (const auto& entry : signature) {
    identifiers.emplace(entry.symbol, entry.identifier);
  }
  std::vector<std::pair<Symbol, std::string>> constantIds;
  for (const auto& [symbol, value] : resolved.constants) {
    std::string identifier = allocator.allocate(symbol.name());
    identifiers.emplace(symbol, identifier);
    constantIds.emplace_back(symbol, identifier);
  }
  std::map<std::string, std::string> functionIds;
  for (const auto& name : resolved.functionNames()) {
    functionIds.emplace(name, allocator.allocate(name));
  }

  CodePrinter printer(identifiers, functionIds, UnknownFunctionPolicy::Fail);
  std::string body = printer.print(target);
  // Symbols bound as constants do not vary per element
  bool varying = false;
  for (const auto& symbol : target.freeSymbols()) {
    if (!resolved.constants.count(symbol)) {
      varying = true;
    }
  }
  bool broadcastConstant = options.vectorize && !varying && !signature.empty();
  std::string source =
      renderSource(body, signature, constantIds, options.vectorize, broadcastConstant);

  // Kernel layout: constants and functions the expression actually uses
  KernelLayout layout;
  layout.signature = signature;
  std::set<Symbol> used = target.freeSymbols();
  for (const auto& [symbol, value] : resolved.constants) {
    if (used.count(symbol)) {
      layout.constants.push_back(symbol);
    }
  }
  std::set<std::string> applied;
  for (const auto& application : target.applications()) {
    applied.insert(application.asApply()->fn->name);
  }
  for (const auto& name : resolved.functionNames()) {
    if (applied.count(name)) {
      layout.functions.push_back(name);
    }
  }

  CodeGen codegen("numify_kernel", *diags_);
  codegen.setDebugMode(diags_->isEnabled(DiagnosticLevel::Debug));
  if (!codegen.compileKernel(target, layout)) {
    throw NumifyError(ErrorKind::CompilationFailed, "Kernel generation failed")
        .setExplanation(expr.toString());
  }
  auto generated = Clock::now();
  OptimizerPipeline::optimize(codegen.getModule(), options.optLevel);
  std::string ir = codegen.moduleText();
  auto optimized = Clock::now();

  auto module = codegen.takeModule();
  auto context = codegen.takeContext();
  auto jit = JitKernel::create(std::move(module), std::move(context), CodeGen::KERNEL_NAME, *diags_);
  auto jitted = Clock::now();

  CompiledArtifact::Kernel kernel{std::move(jit), layout.constants, layout.functions};
  auto artifact = std::make_shared<const CompiledArtifact>(std::move(target),
                                                           std::move(signature),
                                                           std::move(resolved),
                                                           std::move(kernel),
                                                           std::move(source),
                                                           std::move(ir),
                                                           options.vectorize);

  std::ostringstream timings;
  timings << std::fixed << std::setprecision(2) << "timings (ms): rewrite="
          << elapsedMs(start, rewrote) << " codegen=" << elapsedMs(rewrote, generated)
          << " optimize=" << elapsedMs(generated, optimized)
          << " jit=" << elapsedMs(optimized, jitted)
          << " total=" << elapsedMs(start, Clock::now());
  diags_->emitDebug(timings.str());
  return artifact;
}

void Compiler::cacheClear() {
  if (cache_) {
    cache_->clear();
  }
}

CacheStats Compiler::cacheStats() const {
  return cache_ ? cache_->stats() : CacheStats{};
}

}  // namespace numify
