#include "../src/compile/identifiers.hpp"
#include "../test/test_framework.hpp"

#include <set>

using namespace numify;
using namespace numify::test;

void registerIdentifierTests(numify::test::TestRunner& runner) {
  auto* suite = new TestSuite("Identifier Allocation Tests");

  suite->addTest("Valid names are kept", []() {
    IdentifierAllocator allocator;
    assertEqual("x", allocator.allocate("x"));
    assertEqual("alpha_1b", allocator.allocate("alpha_1b"));
    assertTrue(allocator.isTaken("x"));
  });

  suite->addTest("Mangle illegal characters", []() {
    assertEqual("x_", IdentifierAllocator::mangle("x'"));
    assertEqual("a_b", IdentifierAllocator::mangle("a.b"));
    assertEqual("_2x", IdentifierAllocator::mangle("2x"));
    assertEqual("_", IdentifierAllocator::mangle(""));
    assertEqual("for_", IdentifierAllocator::mangle("for"));
  });

  suite->addTest("Keywords are not valid identifiers", []() {
    assertTrue(IdentifierAllocator::isKeyword("return"));
    assertFalse(IdentifierAllocator::isValidIdentifier("return"));
    assertFalse(IdentifierAllocator::isValidIdentifier("1a"));
    assertFalse(IdentifierAllocator::isValidIdentifier("a-b"));
    assertTrue(IdentifierAllocator::isValidIdentifier("_a1"));
  });

  suite->addTest("Reserved names get suffixes", []() {
    IdentifierAllocator allocator;
    assertEqual("sin_1", allocator.allocate("sin"));
    assertEqual("_out_1", allocator.allocate("_out"));
    assertEqual("kernel_1", allocator.allocate("kernel"));
  });

  suite->addTest("Collisions get increasing suffixes", []() {
    IdentifierAllocator allocator;
    assertEqual("x", allocator.allocate("x"));
    assertEqual("x_1", allocator.allocate("x"));
    assertEqual("x_2", allocator.allocate("x"));
    assertEqual("x_", allocator.allocate("x'"));
  });

  suite->addTest("Signature follows spec order and is unique", []() {
    Symbol plain("x");
    Symbol tagged("x", "positive");
    Symbol prime("x'");
    Symbol keyword("lambda");
    VarSpec spec = VarSpec::sequence({plain, tagged, prime, keyword});
    CallSignature signature = allocateSignature(spec);
    assertEqual(4, (int)signature.size());
    std::set<std::string> unique;
    for (size_t i = 0; i < signature.size(); ++i) {
      assertTrue(signature[i].symbol == spec.all()[i]);
      assertTrue(IdentifierAllocator::isValidIdentifier(signature[i].identifier));
      unique.insert(signature[i].identifier);
    }
    assertEqual(4, (int)unique.size());
    assertEqual("x", signature[0].identifier);
    assertEqual("x_1", signature[1].identifier);
  });

  suite->addTest("Allocation is deterministic", []() {
    VarSpec spec = VarSpec::sequence({Symbol("a b"), Symbol("a_b"), Symbol("int")});
    assertTrue(allocateSignature(spec) == allocateSignature(spec));
  });

  suite->addTest("Custom reserved set", []() {
    IdentifierAllocator allocator(std::set<std::string>{"x"});
    assertEqual("x_1", allocator.allocate("x"));
    assertEqual("sin", allocator.allocate("sin"));
  });

  runner.addSuite(suite);
}
