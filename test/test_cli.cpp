#include "../src/cli/driver.hpp"
#include "../test/test_framework.hpp"

#include <sstream>

using namespace numify;
using namespace numify::test;

namespace {

std::string eval(const std::vector<std::string>& args) {
  cli::Invocation inv = cli::parseInvocation(args);
  DiagnosticEngine diags;
  std::ostringstream out;
  assertEqual(0, cli::runEval(inv, diags, out));
  return out.str();
}

}  // namespace

void registerCliTests(numify::test::TestRunner& runner) {
  auto* suite = new TestSuite("CLI Tests");

  suite->addTest("Values parse as scalars or arrays", []() {
    NumericValue scalar = cli::parseValue("2.5");
    assertTrue(scalar.isScalar());
    assertNear(2.5, scalar.scalar());

    NumericValue values = cli::parseValue("1,2,3");
    assertTrue(values.isArray());
    assertEqual(3, (int)values.size());
    assertNear(3.0, values[2]);

    assertThrowsKind(ErrorKind::InvalidSpec, []() { cli::parseValue("1,two"); });
  });

  suite->addTest("Vars declare positional and keyword slots", []() {
    VarSpec spec = cli::parseVars("x,gain:g");
    assertEqual(2, (int)spec.size());
    assertEqual(1, (int)spec.keyed().size());
    assertEqual("gain", spec.keyed()[0].first);
    assertEqual("(x, gain=g)", spec.toString());
  });

  suite->addTest("Options are collected", []() {
    cli::Invocation inv = cli::parseInvocation(
        {"x + a", "--vars", "x", "--bind", "a=2", "-O0", "--no-expand", "--ir", "--debug"});
    assertEqual("x + a", inv.expression);
    assertTrue(inv.vars.has_value());
    assertEqual(1, (int)inv.constants.size());
    assertEqual("a", inv.constants[0].first);
    assertEqual(0, inv.options.optLevel);
    assertFalse(inv.options.expandDefinition);
    assertTrue(inv.showIr);
    assertTrue(inv.debug);
  });

  suite->addTest("Negative literal is an expression", []() {
    cli::Invocation inv = cli::parseInvocation({"-2"});
    assertEqual("-2", inv.expression);
  });

  suite->addTest("Malformed command lines are rejected", []() {
    assertThrowsKind(ErrorKind::InvalidSpec, []() { cli::parseInvocation({"x", "--bogus"}); });
    assertThrowsKind(ErrorKind::InvalidSpec, []() { cli::parseInvocation({"--arg", "1"}); });
    assertThrowsKind(ErrorKind::InvalidSpec, []() { cli::parseInvocation({"x", "--vars"}); });
    assertThrowsKind(ErrorKind::InvalidSpec,
                     []() { cli::parseInvocation({"x", "--bind", "=3"}); });
  });

  suite->addTest("Eval infers variables when none are given", []() {
    assertEqual("7\n", eval({"x*y + 1", "--arg", "2", "--arg", "3"}));
  });

  suite->addTest("Eval with explicit vars", []() {
    assertEqual("7\n", eval({"x*y + 1", "--vars", "x,y", "--arg", "2", "--arg", "3"}));
  });

  suite->addTest("Eval with a keyword slot", []() {
    assertEqual("8\n", eval({"x*g", "--vars", "x,gain:g", "--arg", "2", "--kw", "gain=4"}));
  });

  suite->addTest("Eval with a bound constant", []() {
    assertEqual("6\n", eval({"a*x", "--bind", "a=3", "--arg", "2"}));
  });

  suite->addTest("Eval with a frozen variable", []() {
    assertEqual("6\n", eval({"a*x", "--vars", "x,a", "--freeze", "a=2", "--arg", "3"}));
  });

  suite->addTest("Eval with an array argument", []() {
    assertEqual("[2, 3, 4]\n", eval({"x + 1", "--arg", "1,2,3"}));
  });

  suite->addTest("Scalar-only evaluation rejects arrays", []() {
    assertThrowsKind(ErrorKind::ShapeMismatch,
                     []() { eval({"x + 1", "--no-vectorize", "--arg", "1,2"}); });
  });

  suite->addTest("Eval reports missing arguments", []() {
    assertThrowsKind(ErrorKind::CallArityMismatch, []() { eval({"x*y", "--arg", "2"}); });
  });

  suite->addTest("Source prints the listing and IR", []() {
    cli::Invocation inv = cli::parseInvocation({"sin(x) * k", "--vars", "x,k", "--ir"});
    DiagnosticEngine diags;
    std::ostringstream out;
    assertEqual(0, cli::runSource(inv, diags, out));
    std::string text = out.str();
    assertContains(text, "NumericFunction(");
    assertContains(text, "NumericValue kernel(NumericValue x, NumericValue k)");
    assertContains(text, "define void @kernel");
  });

  suite->addTest("Usage lists the subcommands", []() {
    std::ostringstream out;
    cli::printUsage("numify", out);
    assertContains(out.str(), "eval");
    assertContains(out.str(), "source");
    assertContains(out.str(), "--freeze sym=V");
  });

  runner.addSuite(suite);
}
