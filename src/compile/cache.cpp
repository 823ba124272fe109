// Numify Expression Compiler - Compilation Cache
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/cache.hpp"

#include <algorithm>
#include <tuple>

namespace numify {

namespace {

size_t hashCombine(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

BindingMarker markValue(BindingMarker marker, const BindingValue& value) {
  if (auto* number = std::get_if<NumericValue>(&value)) {
    if (number->isScalar()) {
      marker.valueKind = 'H';
      marker.value = number->scalar();
    } else {
      marker.valueKind = 'I';
      marker.valueId = number->identity();
    }
  } else {
    marker.valueKind = 'I';
    marker.valueId = std::get<NumericFnPtr>(value).get();
  }
  return marker;
}

}  // namespace

bool BindingMarker::operator==(const BindingMarker& other) const {
  return keyKind == other.keyKind && key == other.key && keyId == other.keyId &&
         valueKind == other.valueKind && valueId == other.valueId &&
         (value == other.value || (value != value && other.value != other.value));
}

bool BindingMarker::operator<(const BindingMarker& other) const {
  return std::tie(keyKind, key, keyId) < std::tie(other.keyKind, other.key, other.keyId);
}

CacheKey CacheKey::make(const Expr& expression,
                        const VarSpec& vars,
                        const Bindings& bindings,
                        const CompileOptions& options) {
  CacheKey key;
  key.expression = expression;
  key.vars = vars.all();
  key.vectorize = options.vectorize;
  key.expandDefinition = options.expandDefinition;
  key.optLevel = options.optLevel;
  key.maxRewritePasses = options.maxRewritePasses;

  for (const auto& [bindingKey, value] : bindings) {
    BindingMarker marker{'K', "", nullptr, 'H', 0.0, nullptr};

    if (auto* fn = std::get_if<FunctionRef>(&bindingKey)) {
      if (*fn) {
        marker.keyKind = 'F';
        marker.key = (*fn)->name;
        marker.keyId = fn->get();
      }
    } else {
      const Expr& keyExpr = std::get<Expr>(bindingKey);
      if (auto* symbol = keyExpr.asSymbol()) {
        marker.keyKind = 'S';
        marker.key = symbol->name() + "\x1f" + symbol->tag();
      } else if (auto* application = keyExpr.asApply()) {
        // Application keys bind their function
        marker.keyKind = 'F';
        marker.key = application->fn->name;
        marker.keyId = application->fn.get();
      } else {
        marker.key = keyExpr.toString();
      }
    }

    key.bindings.push_back(markValue(marker, value));
  }

  std::stable_sort(key.bindings.begin(), key.bindings.end());
  return key;
}

size_t CacheKey::hash() const {
  size_t seed = expression.hash();
  for (const auto& symbol : vars) {
    seed = hashCombine(seed, symbol.hash());
  }
  for (const auto& marker : bindings) {
    seed = hashCombine(seed, std::hash<std::string>{}(marker.key));
    seed = hashCombine(seed, static_cast<size_t>(marker.keyKind));
    if (marker.valueKind == 'H') {
      seed = hashCombine(seed, std::hash<double>{}(marker.value));
    } else {
      seed = hashCombine(seed, std::hash<const void*>{}(marker.valueId));
    }
  }
  seed = hashCombine(seed, (vectorize ? 1u : 0u) | (expandDefinition ? 2u : 0u));
  seed = hashCombine(seed, static_cast<size_t>(optLevel));
  return hashCombine(seed, static_cast<size_t>(maxRewritePasses));
}

bool CacheKey::operator==(const CacheKey& other) const {
  return vectorize == other.vectorize && expandDefinition == other.expandDefinition &&
         optLevel == other.optLevel && maxRewritePasses == other.maxRewritePasses &&
         vars == other.vars && bindings == other.bindings && expression == other.expression;
}

CompilationCache::CompilationCache(size_t capacity)
    : capacity_(capacity) {}

ArtifactPtr CompilationCache::getOrCompile(const CacheKey& key,
                                           const std::function<ArtifactPtr()>& compile) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto found = index_.find(key);
  if (found != index_.end()) {
    hits_++;
    lru_.splice(lru_.begin(), lru_, found->second);
    return found->second->second;
  }

  misses_++;
  ArtifactPtr artifact = compile();
  if (capacity_ == 0) {
    return artifact;
  }

  lru_.emplace_front(key, artifact);
  index_[key] = lru_.begin();

  while (lru_.size() > capacity_) {
    index_.erase(lru_.back().first);
    lru_.pop_back();
    evictions_++;
  }

  return artifact;
}

bool CompilationCache::contains(const CacheKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(key) > 0;
}

void CompilationCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  index_.clear();
  lru_.clear();
  hits_ = 0;
  misses_ = 0;
  evictions_ = 0;
}

CacheStats CompilationCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.hits = hits_;
  stats.misses = misses_;
  stats.evictions = evictions_;
  stats.size = lru_.size();
  stats.capacity = capacity_;
  return stats;
}

}  // namespace numify
