#include "../src/compile/var_spec.hpp"
#include "../test/test_framework.hpp"

using namespace numify;
using namespace numify::test;

void registerVarSpecTests(numify::test::TestRunner& runner) {
  auto* suite = new TestSuite("Variable Spec Tests");

  suite->addTest("Single symbol", []() {
    VarSpec spec = VarSpec::of(Symbol("x"));
    assertEqual(1, (int)spec.size());
    assertTrue(spec.keyed().empty());
    assertEqual("(x)", spec.toString());
  });

  suite->addTest("Sequence keeps order", []() {
    Symbol b("b");
    Symbol a("a");
    VarSpec spec = VarSpec::sequence({b, a});
    assertTrue(spec.all()[0] == b);
    assertTrue(spec.all()[1] == a);
    assertEqual(1, (int)*spec.indexOf(a));
  });

  suite->addTest("Empty sequence", []() {
    VarSpec spec = VarSpec::sequence({});
    assertTrue(spec.empty());
    assertEqual("()", spec.toString());
  });

  suite->addTest("Mapping sorts integer keys and appends keywords", []() {
    Symbol x("x");
    Symbol y("y");
    Symbol g("g");
    VarSpec spec = VarSpec::mapping({{VarKey(std::string("gain")), g}, {VarKey(1), y}, {VarKey(0), x}});
    assertEqual(3, (int)spec.size());
    assertTrue(spec.all()[0] == x);
    assertTrue(spec.all()[1] == y);
    assertTrue(spec.all()[2] == g);
    assertEqual(1, (int)spec.keyed().size());
    assertEqual("gain", spec.keyed()[0].first);
    assertEqual("(x, y, gain=g)", spec.toString());
  });

  suite->addTest("Mapping rejects gaps in integer keys", []() {
    auto error = assertThrowsKind(ErrorKind::InvalidSpec, []() {
      VarSpec::mapping({{VarKey(0), Symbol("x")}, {VarKey(2), Symbol("y")}});
    });
    assertContains(error.what(), "contiguous");
  });

  suite->addTest("Mapping rejects keys not starting at zero", []() {
    assertThrowsKind(ErrorKind::InvalidSpec,
                     []() { VarSpec::mapping({{VarKey(1), Symbol("x")}}); });
  });

  suite->addTest("Mapping rejects repeated integer keys", []() {
    auto error = assertThrowsKind(ErrorKind::InvalidSpec, []() {
      VarSpec::mapping({{VarKey(0), Symbol("x")}, {VarKey(0), Symbol("y")}});
    });
    assertContains(error.what(), "Duplicate integer key");
    assertEqual(1, (int)error.names().size());
    assertEqual("0", error.names()[0]);
  });

  suite->addTest("Duplicate symbols are rejected", []() {
    Symbol x("x");
    auto error = assertThrowsKind(ErrorKind::InvalidSpec, [&]() { VarSpec::sequence({x, x}); });
    assertContains(error.what(), "Duplicate symbol");
    assertEqual(1, (int)error.names().size());

    assertThrowsKind(ErrorKind::InvalidSpec, [&]() {
      VarSpec::mixed({VarSlot::positional(x), VarSlot::named("k", x)});
    });
  });

  suite->addTest("Duplicate and empty keywords are rejected", []() {
    assertThrowsKind(ErrorKind::InvalidSpec, []() {
      VarSpec::mixed({VarSlot::named("k", Symbol("a")), VarSlot::named("k", Symbol("b"))});
    });
    assertThrowsKind(ErrorKind::InvalidSpec,
                     []() { VarSpec::mixed({VarSlot::named("", Symbol("a"))}); });
  });

  suite->addTest("Symbols sharing a display name stay distinct", []() {
    Symbol plain("x");
    Symbol positive("x", "positive");
    VarSpec spec = VarSpec::sequence({plain, positive});
    assertEqual(2, (int)spec.size());
    assertEqual(1, (int)*spec.indexOf(positive));
  });

  suite->addTest("Inferred spec orders free symbols by name", []() {
    Symbol x("x");
    Symbol a("a");
    VarSpec spec = VarSpec::inferred(Expr(x) * sin(Expr(a)) + Expr(x));
    assertEqual(2, (int)spec.size());
    assertTrue(spec.all()[0] == a);
    assertTrue(spec.all()[1] == x);
  });

  suite->addTest("Equality follows slots", []() {
    Symbol x("x");
    assertTrue(VarSpec::of(x) == VarSpec::sequence({x}));
    assertTrue(VarSpec::of(x) != VarSpec::mixed({VarSlot::named("x", x)}));
    assertFalse(VarSpec::sequence({}).contains(x));
  });

  runner.addSuite(suite);
}
