#include "../src/compile/cache.hpp"
#include "../src/compile/compiler.hpp"
#include "../test/test_framework.hpp"

#include <atomic>
#include <thread>

using namespace numify;
using namespace numify::test;

namespace {

ArtifactPtr dummyArtifact(const VarSpec& vars) {
  return CompiledArtifact::fromCallable(
      [](const std::vector<NumericValue>&) { return NumericValue(0.0); }, allocateSignature(vars),
      "dummy");
}

CacheKey keyFor(const Expr& expr, const VarSpec& vars, const Bindings& bindings = {}) {
  return CacheKey::make(expr, vars, bindings, CompileOptions{});
}

}  // namespace

void registerCacheTests(numify::test::TestRunner& runner) {
  auto* suite = new TestSuite("Compilation Cache Tests");

  suite->addTest("Equal requests make equal keys", []() {
    Symbol x("x");
    Symbol a("a");
    CacheKey k1 = keyFor(Expr(a) * Expr(x), VarSpec::of(x), {{Expr(a), NumericValue(2.0)}});
    CacheKey k2 = keyFor(Expr(a) * Expr(x), VarSpec::of(x), {{Expr(a), NumericValue(2.0)}});
    assertTrue(k1 == k2);
    assertTrue(k1.hash() == k2.hash());
  });

  suite->addTest("Keys distinguish vars, values and options", []() {
    Symbol x("x");
    Symbol y("y");
    Symbol a("a");
    Expr expr = Expr(a) * Expr(x) + Expr(y);
    CacheKey base = keyFor(expr, VarSpec::sequence({x, y}), {{Expr(a), NumericValue(2.0)}});
    assertFalse(base == keyFor(expr, VarSpec::sequence({y, x}), {{Expr(a), NumericValue(2.0)}}));
    assertFalse(base == keyFor(expr, VarSpec::sequence({x, y}), {{Expr(a), NumericValue(3.0)}}));

    CompileOptions scalar;
    scalar.vectorize = false;
    assertFalse(base == CacheKey::make(expr, VarSpec::sequence({x, y}),
                                       {{Expr(a), NumericValue(2.0)}}, scalar));
  });

  suite->addTest("Binding order does not matter", []() {
    Symbol x("x");
    Symbol a("a");
    Symbol b("b");
    Expr expr = Expr(a) * Expr(x) + Expr(b);
    CacheKey k1 = keyFor(expr, VarSpec::of(x),
                         {{Expr(a), NumericValue(1.0)}, {Expr(b), NumericValue(2.0)}});
    CacheKey k2 = keyFor(expr, VarSpec::of(x),
                         {{Expr(b), NumericValue(2.0)}, {Expr(a), NumericValue(1.0)}});
    assertTrue(k1 == k2);
  });

  suite->addTest("Array constants key by identity", []() {
    Symbol x("x");
    Symbol a("a");
    NumericValue shared = NumericValue::array({1.0, 2.0});
    NumericValue copy = NumericValue::array({1.0, 2.0});
    Expr expr = Expr(a) * Expr(x);
    assertTrue(keyFor(expr, VarSpec::of(x), {{Expr(a), shared}}) ==
               keyFor(expr, VarSpec::of(x), {{Expr(a), shared}}));
    assertFalse(keyFor(expr, VarSpec::of(x), {{Expr(a), shared}}) ==
                keyFor(expr, VarSpec::of(x), {{Expr(a), copy}}));
  });

  suite->addTest("Same-named functions are distinct keys", []() {
    Symbol x("x");
    FunctionRef f1 = declareFunction("f", 1);
    FunctionRef f2 = declareFunction("f", 1);
    NumericFnPtr impl = makeNumericFn([](const std::vector<double>& v) { return v[0]; });
    assertFalse(keyFor(applyFunction(f1, {Expr(x)}), VarSpec::of(x), {{f1, impl}}) ==
                keyFor(applyFunction(f2, {Expr(x)}), VarSpec::of(x), {{f2, impl}}));
  });

  suite->addTest("Hits, misses and LRU eviction", []() {
    CompilationCache cache(2);
    Symbol x("x");
    VarSpec vars = VarSpec::of(x);
    int compiles = 0;
    auto compile = [&]() {
      compiles++;
      return dummyArtifact(vars);
    };

    CacheKey k1 = keyFor(Expr(x) + 1, vars);
    CacheKey k2 = keyFor(Expr(x) + 2, vars);
    CacheKey k3 = keyFor(Expr(x) + 3, vars);

    ArtifactPtr first = cache.getOrCompile(k1, compile);
    cache.getOrCompile(k2, compile);
    assertTrue(cache.getOrCompile(k1, compile) == first);  // k1 becomes most recent
    cache.getOrCompile(k3, compile);                        // evicts k2

    assertTrue(cache.contains(k1));
    assertFalse(cache.contains(k2));
    assertTrue(cache.contains(k3));
    assertEqual(3, compiles);

    CacheStats stats = cache.stats();
    assertEqual(1, (int)stats.hits);
    assertEqual(3, (int)stats.misses);
    assertEqual(1, (int)stats.evictions);
    assertEqual(2, (int)stats.size);
    assertEqual(2, (int)stats.capacity);
  });

  suite->addTest("Failed compilations are not cached", []() {
    CompilationCache cache;
    Symbol x("x");
    CacheKey key = keyFor(Expr(x), VarSpec::of(x));
    try {
      cache.getOrCompile(key, []() -> ArtifactPtr {
        throw NumifyError(ErrorKind::CompilationFailed, "boom");
      });
      assertTrue(false, "Expected CompilationFailed");
    } catch (const NumifyError& e) {
      assertTrue(e.kind() == ErrorKind::CompilationFailed);
    }
    assertFalse(cache.contains(key));
  });

  suite->addTest("Zero capacity retains nothing", []() {
    CompilationCache cache(0);
    Symbol x("x");
    CacheKey key = keyFor(Expr(x), VarSpec::of(x));
    cache.getOrCompile(key, [&]() { return dummyArtifact(VarSpec::of(x)); });
    assertFalse(cache.contains(key));
    assertEqual(0, (int)cache.stats().size);
  });

  suite->addTest("Clear drops entries and counters", []() {
    CompilationCache cache;
    Symbol x("x");
    CacheKey key = keyFor(Expr(x), VarSpec::of(x));
    cache.getOrCompile(key, [&]() { return dummyArtifact(VarSpec::of(x)); });
    cache.clear();
    assertFalse(cache.contains(key));
    assertEqual(0, (int)cache.stats().misses);
  });

  suite->addTest("Compiler reuses artifacts across keyword naming", []() {
    CompilationCache cache;
    Compiler compiler(&cache);
    Symbol x("x");
    Symbol g("g");
    Expr expr = Expr(g) * Expr(x);
    NumericFunction f1 = compiler.compile(expr, VarSpec::mixed({VarSlot::positional(x), VarSlot::named("gain", g)}));
    NumericFunction f2 = compiler.compile(expr, VarSpec::mixed({VarSlot::positional(x), VarSlot::named("k", g)}));
    assertTrue(f1.artifact() == f2.artifact());
    assertNear(6.0, f1.call({2.0}, {{"gain", 3.0}}).scalar());
    assertNear(6.0, f2.call({2.0}, {{"k", 3.0}}).scalar());
    assertEqual(1, (int)compiler.cacheStats().hits);
  });

  suite->addTest("Compiler bypasses the cache on request", []() {
    CompilationCache cache;
    Compiler compiler(&cache);
    Symbol x("x");
    CompileOptions options;
    options.cache = false;
    NumericFunction f1 = compiler.compile(Expr(x) + 1, VarSpec::of(x), {}, options);
    NumericFunction f2 = compiler.compile(Expr(x) + 1, VarSpec::of(x), {}, options);
    assertFalse(f1.artifact() == f2.artifact());
    assertEqual(0, (int)compiler.cacheStats().size);
  });

  suite->addTest("Concurrent requests compile once", []() {
    CompilationCache cache;
    Symbol x("x");
    CacheKey key = keyFor(Expr(x) * 2, VarSpec::of(x));
    std::atomic<int> compiles{0};
    std::vector<ArtifactPtr> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
      threads.emplace_back([&, i]() {
        results[i] = cache.getOrCompile(key, [&]() {
          compiles++;
          return dummyArtifact(VarSpec::of(x));
        });
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    assertEqual(1, compiles.load());
    for (const auto& result : results) {
      assertTrue(result == results.front());
    }
  });

  runner.addSuite(suite);
}
