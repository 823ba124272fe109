// Numify Expression Compiler - Compiler Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "codegen/support/diagnostics.hpp"
#include "compile/artifact.hpp"
#include "compile/bindings.hpp"
#include "compile/cache.hpp"
#include "compile/numeric_function.hpp"
#include "compile/options.hpp"
#include "compile/var_spec.hpp"
#include "expr/expr.hpp"

#include <memory>

namespace numify {

// Turns symbolic expressions into numeric functions.
// Pipeline: rewrite definitions, resolve bindings, validate symbols and functions,
// allocate identifiers, generate and JIT a vectorized kernel.
class Compiler {
public:
  // Neither pointer is owned; a null engine selects a private one reporting warnings
  explicit Compiler(CompilationCache* cache = nullptr, DiagnosticEngine* diags = nullptr);

  NumericFunction compile(const Expr& expr,
                          const VarSpec& vars,
                          const Bindings& bindings = {},
                          const CompileOptions& options = {});

  // Variables are the free symbols not bound to constants, ordered by name
  NumericFunction compileInferred(const Expr& expr,
                                  const Bindings& bindings = {},
                                  const CompileOptions& options = {});

  // Cache-aware compilation without the calling-convention wrapper
  ArtifactPtr compileArtifact(const Expr& expr,
                              const VarSpec& vars,
                              const Bindings& bindings = {},
                              const CompileOptions& options = {});

  void cacheClear();
  CacheStats cacheStats() const;

  DiagnosticEngine& diagnostics() { return *diags_; }

private:
  ArtifactPtr build(const Expr& expr,
                    const VarSpec& vars,
                    const Bindings& bindings,
                    const CompileOptions& options);

  CompilationCache* cache_;
  std::unique_ptr<DiagnosticEngine> ownedDiags_;
  DiagnosticEngine* diags_;
};

}  // namespace numify
