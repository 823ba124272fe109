// Numify Expression Compiler - Compilation Cache Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "compile/artifact.hpp"
#include "compile/bindings.hpp"
#include "compile/options.hpp"
#include "compile/var_spec.hpp"
#include "expr/expr.hpp"

#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace numify {

// Hashable projection of one explicit binding
struct BindingMarker {
  char keyKind;           // 'S' symbol, 'F' function, 'K' invalid key
  std::string key;        // symbol identity or function name
  const void* keyId;      // function identity
  char valueKind;         // 'H' scalar value, 'I' object identity
  double value;
  const void* valueId;

  bool operator==(const BindingMarker& other) const;
  bool operator<(const BindingMarker& other) const;
};

// Canonical fingerprint of a compile request
struct CacheKey {
  Expr expression;
  std::vector<Symbol> vars;
  std::vector<BindingMarker> bindings;  // sorted by key
  bool vectorize = true;
  bool expandDefinition = true;
  int optLevel = 2;
  int maxRewritePasses = 10;

  static CacheKey make(const Expr& expression,
                       const VarSpec& vars,
                       const Bindings& bindings,
                       const CompileOptions& options);

  size_t hash() const;
  bool operator==(const CacheKey& other) const;
};

struct CacheKeyHash {
  size_t operator()(const CacheKey& key) const { return key.hash(); }
};

struct CacheStats {
  size_t hits = 0;
  size_t misses = 0;
  size_t evictions = 0;
  size_t size = 0;
  size_t capacity = 0;
};

// Bounded LRU map from request fingerprint to artifact.
// Lookup, compile and insert run under one lock, so concurrent requests for the
// same key compile once and no reader sees a partial artifact.
class CompilationCache {
public:
  static constexpr size_t DEFAULT_CAPACITY = 256;

  explicit CompilationCache(size_t capacity = DEFAULT_CAPACITY);

  CompilationCache(const CompilationCache&) = delete;
  CompilationCache& operator=(const CompilationCache&) = delete;

  // Cached artifact, or the result of compile() inserted as most recently used.
  // Nothing is inserted when compile() throws.
  ArtifactPtr getOrCompile(const CacheKey& key, const std::function<ArtifactPtr()>& compile);

  bool contains(const CacheKey& key) const;

  // Drop every entry and reset the counters
  void clear();

  CacheStats stats() const;

private:
  using Entry = std::pair<CacheKey, ArtifactPtr>;

  size_t capacity_;
  std::list<Entry> lru_;  // front is most recently used
  std::unordered_map<CacheKey, std::list<Entry>::iterator, CacheKeyHash> index_;
  size_t hits_ = 0;
  size_t misses_ = 0;
  size_t evictions_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace numify
