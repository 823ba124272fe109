// Numify Expression Compiler - Compiled Artifact Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "codegen/jit.hpp"
#include "compile/bindings.hpp"
#include "compile/identifiers.hpp"
#include "expr/expr.hpp"
#include "runtime/value.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace numify {

// Plain host implementation taking one value per signature entry
using HostFn = std::function<NumericValue(const std::vector<NumericValue>&)>;

// Immutable result of a compilation, shared by every wrapper that uses it
class CompiledArtifact {
public:
  struct Kernel {
    std::unique_ptr<JitKernel> jit;
    std::vector<Symbol> constants;       // kernel inputs after the signature
    std::vector<std::string> functions;  // host-callback table order
  };

  CompiledArtifact(Expr expression,
                   CallSignature signature,
                   BindingSet bindings,
                   Kernel kernel,
                   std::string source,
                   std::string ir,
                   bool vectorized);

  // Artifact around a host callable; it has no symbolic form and no generated code
  static std::shared_ptr<const CompiledArtifact> fromCallable(HostFn fn,
                                                              CallSignature signature,
                                                              std::string description);

  CompiledArtifact(const CompiledArtifact&) = delete;
  CompiledArtifact& operator=(const CompiledArtifact&) = delete;

  const std::optional<Expr>& expression() const { return expression_; }
  const CallSignature& signature() const { return signature_; }
  const std::map<Symbol, NumericValue>& constants() const { return bindings_.constants; }
  const BindingSet& bindings() const { return bindings_; }
  const std::string& source() const { return source_; }
  const std::string& ir() const { return ir_; }
  bool vectorized() const { return vectorized_; }

  // One value per signature entry, in order. Output takes the broadcast shape
  // of the inputs. Exceptions from bound functions propagate to the caller.
  NumericValue invoke(const std::vector<NumericValue>& args) const;

private:
  CompiledArtifact(HostFn fn, CallSignature signature, std::string description);

  NumericValue runKernel(const std::vector<NumericValue>& args) const;

  std::optional<Expr> expression_;
  CallSignature signature_;
  BindingSet bindings_;
  Kernel kernel_;
  std::vector<NumericFnPtr> functionTable_;
  HostFn host_;
  std::string source_;
  std::string ir_;
  bool vectorized_;
};

using ArtifactPtr = std::shared_ptr<const CompiledArtifact>;

}  // namespace numify
