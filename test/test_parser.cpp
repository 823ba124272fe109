#include "../src/parser/parser.hpp"
#include "../test/test_framework.hpp"

#include <cmath>

using namespace numify;
using namespace numify::test;

namespace {

Expr parse(const std::string& source, ParseEnvironment env = {}) {
  return Parser::parseExpressionFromSource(source, std::move(env));
}

double eval(const std::string& source, const std::map<Symbol, double>& values = {}) {
  return evaluate(parse(source), values);
}

}  // namespace

void registerParserTests(numify::test::TestRunner& runner) {
  auto* suite = new TestSuite("Parser Tests");

  suite->addTest("Parse symbol", []() {
    Expr expr = parse("x");
    assertTrue(expr.isSymbol());
    assertEqual("x", expr.asSymbol()->name());
  });

  suite->addTest("Precedence of products over sums", []() {
    assertNear(7.0, eval("1 + 2 * 3"));
    assertNear(9.0, eval("(1 + 2) * 3"));
    assertNear(1.0, eval("7 - 3 - 3"));
    assertNear(2.0, eval("12 / 3 / 2"));
  });

  suite->addTest("Power is right associative", []() {
    assertNear(512.0, eval("2 ^ 3 ^ 2"));
    assertNear(512.0, eval("2 ** 3 ** 2"));
  });

  suite->addTest("Unary minus binds looser than power", []() {
    assertNear(-4.0, eval("-2^2"));
    assertNear(4.0, eval("(-2)^2"));
    assertNear(-6.0, eval("-2*3"));
  });

  suite->addTest("Builtin calls", []() {
    Symbol x("x");
    assertNear(std::sin(0.5) * std::cos(0.5), eval("sin(x) * cos(x)", {{x, 0.5}}));
    assertNear(std::atan2(1.0, 2.0), eval("atan2(1, 2)"));
    assertNear(std::log(3.0), eval("ln(3)"));
  });

  suite->addTest("Pi constant", []() { assertNear(M_PI, eval("pi")); });

  suite->addTest("Builtin arity is checked", []() {
    assertThrowsKind(ErrorKind::ParseError, []() { parse("sin(x, y)"); });
    assertThrowsKind(ErrorKind::ParseError, []() { parse("atan2(x)"); });
  });

  suite->addTest("Unknown calls become opaque functions", []() {
    Lexer lexer("G(x) + G(y)");
    Parser parser(lexer.tokenize());
    Expr expr = parser.parseExpression();
    auto apps = expr.applications();
    assertEqual(2, (int)apps.size());
    assertTrue(apps[0].asApply()->fn == apps[1].asApply()->fn, "Calls share one declaration");
    assertEqual(1, (int)parser.functions().size());
  });

  suite->addTest("Environment functions and symbols are reused", []() {
    Symbol t("t", "real");
    FunctionRef f = declareFunction("f", 2);
    ParseEnvironment env;
    env.symbols.emplace("t", t);
    env.functions.emplace("f", f);
    Expr expr = parse("f(t, 1)", env);
    assertTrue(expr.asApply() != nullptr);
    assertTrue(expr.asApply()->fn == f);
    assertTrue(expr.freeSymbols().count(t) == 1);
  });

  suite->addTest("Registered arity is checked", []() {
    ParseEnvironment env;
    env.functions.emplace("f", declareFunction("f", 2));
    assertThrowsKind(ErrorKind::ParseError, [&]() { parse("f(1)", env); });
  });

  suite->addTest("Reject trailing input", []() {
    auto error = assertThrowsKind(ErrorKind::ParseError, []() { parse("x y"); });
    assertContains(error.what(), "trailing");
  });

  suite->addTest("Reject unbalanced parentheses", []() {
    assertThrowsKind(ErrorKind::ParseError, []() { parse("(x + 1"); });
    assertThrowsKind(ErrorKind::ParseError, []() { parse("x +"); });
  });

  suite->addTest("Parse error carries position", []() {
    try {
      parse("x + * y");
      assertTrue(false, "Expected ParseError");
    } catch (const ParseError& e) {
      assertEqual(1, (int)e.line());
      assertEqual(5, (int)e.column());
    }
  });

  runner.addSuite(suite);
}
