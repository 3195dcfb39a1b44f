#include "pyduino/Lexer.h"
#include "pyduino/Parser.h"

#include <doctest/doctest.h>

namespace {
pyduino::Module parseModule(const std::string &source) {
  pyduino::Lexer lexer(source);
  pyduino::Parser parser(lexer.tokenize());
  pyduino::Module module;
  std::string error;
  CHECK(parser.parse(module, error));
  CHECK(error.empty());
  return module;
}

const pyduino::Expr &assignedValue(const pyduino::Module &module, size_t index = 0) {
  REQUIRE(module.body.size() > index);
  REQUIRE(module.body[index].value.has_value());
  return *module.body[index].value;
}
} // namespace

TEST_SUITE_BEGIN("pyduino.parser.basic");

TEST_CASE("parses simple assignment") {
  const auto module = parseModule("x = 5\n");
  REQUIRE(module.body.size() == 1);
  const auto &stmt = module.body[0];
  CHECK(stmt.kind == pyduino::Stmt::Kind::Assign);
  REQUIRE(stmt.targets.size() == 1);
  CHECK(stmt.targets[0].name == "x");
  CHECK(stmt.value->kind == pyduino::Expr::Kind::Literal);
  CHECK(stmt.value->literalKind == pyduino::Expr::LiteralKind::Int);
  CHECK(stmt.value->literalText == "5");
  CHECK(stmt.line == 1);
  CHECK(stmt.endLine == 1);
}

TEST_CASE("parses assignment chains left to right") {
  const auto module = parseModule("a = b = 7\n");
  REQUIRE(module.body.size() == 1);
  REQUIRE(module.body[0].targets.size() == 2);
  CHECK(module.body[0].targets[0].name == "a");
  CHECK(module.body[0].targets[1].name == "b");
  CHECK(module.body[0].value->literalText == "7");
}

TEST_CASE("applies arithmetic precedence") {
  const auto module = parseModule("y = 1 + 2 * 3\n");
  const auto &value = assignedValue(module);
  CHECK(value.kind == pyduino::Expr::Kind::BinaryOp);
  CHECK(value.binaryOp == pyduino::BinaryOperator::Add);
  REQUIRE(value.operands.size() == 2);
  CHECK(value.operands[1].kind == pyduino::Expr::Kind::BinaryOp);
  CHECK(value.operands[1].binaryOp == pyduino::BinaryOperator::Mul);
}

TEST_CASE("power is right associative and binds tighter than unary minus") {
  const auto module = parseModule("a = 2 ** 3 ** 2\nb = -2 ** 2\n");
  const auto &a = assignedValue(module, 0);
  CHECK(a.binaryOp == pyduino::BinaryOperator::Pow);
  CHECK(a.operands[0].literalText == "2");
  CHECK(a.operands[1].binaryOp == pyduino::BinaryOperator::Pow);
  const auto &b = assignedValue(module, 1);
  CHECK(b.kind == pyduino::Expr::Kind::UnaryOp);
  CHECK(b.unaryOp == pyduino::UnaryOperator::Neg);
  CHECK(b.operands[0].binaryOp == pyduino::BinaryOperator::Pow);
}

TEST_CASE("collects comparison chains") {
  const auto module = parseModule("ok = a < b <= c\n");
  const auto &value = assignedValue(module);
  CHECK(value.kind == pyduino::Expr::Kind::Compare);
  REQUIRE(value.compareOps.size() == 2);
  CHECK(value.compareOps[0] == pyduino::CompareOperator::Lt);
  CHECK(value.compareOps[1] == pyduino::CompareOperator::LtE);
  CHECK(value.operands.size() == 3);
}

TEST_CASE("maps identity tests and membership") {
  const auto module = parseModule("a = x is not None\nb = x not in y\n");
  const auto &a = assignedValue(module, 0);
  REQUIRE(a.compareOps.size() == 1);
  CHECK(a.compareOps[0] == pyduino::CompareOperator::NotEq);
  CHECK(a.operands[1].literalKind == pyduino::Expr::LiteralKind::None);
  const auto &b = assignedValue(module, 1);
  REQUIRE(b.compareOps.size() == 1);
  CHECK(b.compareOps[0] == pyduino::CompareOperator::NotIn);
}

TEST_CASE("flattens boolean operators") {
  const auto module = parseModule("v = a and b and c or d\n");
  const auto &value = assignedValue(module);
  CHECK(value.kind == pyduino::Expr::Kind::BoolOp);
  CHECK(value.boolOp == pyduino::BoolOperator::Or);
  REQUIRE(value.operands.size() == 2);
  CHECK(value.operands[0].boolOp == pyduino::BoolOperator::And);
  CHECK(value.operands[0].operands.size() == 3);
}

TEST_CASE("normalizes numeric literals") {
  const auto module = parseModule("a = 0x1F\nb = 1_000\nc = .5\nd = 5.\ne = 0b101\nf = 2j\n");
  CHECK(assignedValue(module, 0).literalText == "31");
  CHECK(assignedValue(module, 1).literalText == "1000");
  CHECK(assignedValue(module, 2).literalKind == pyduino::Expr::LiteralKind::Float);
  CHECK(assignedValue(module, 2).literalText == "0.5");
  CHECK(assignedValue(module, 3).literalText == "5.0");
  CHECK(assignedValue(module, 4).literalText == "5");
  CHECK(assignedValue(module, 5).literalKind == pyduino::Expr::LiteralKind::Other);
}

TEST_CASE("decodes and concatenates string literals") {
  const auto module = parseModule("s = 'a\\tb' \"c\"\nt = f'{x}'\n");
  const auto &s = assignedValue(module, 0);
  CHECK(s.literalKind == pyduino::Expr::LiteralKind::String);
  CHECK(s.literalText == "a\tbc");
  CHECK(assignedValue(module, 1).literalKind == pyduino::Expr::LiteralKind::Other);
}

TEST_CASE("parses calls with keyword and starred arguments") {
  const auto module = parseModule("Serial.begin(9600, timeout=5, *rest)\n");
  REQUIRE(module.body.size() == 1);
  CHECK(module.body[0].kind == pyduino::Stmt::Kind::ExpressionStatement);
  const auto &call = *module.body[0].value;
  CHECK(call.kind == pyduino::Expr::Kind::Call);
  REQUIRE(call.operands.size() == 1);
  CHECK(call.operands[0].kind == pyduino::Expr::Kind::Attribute);
  CHECK(call.operands[0].name == "begin");
  REQUIRE(call.args.size() == 3);
  CHECK_FALSE(call.argNames[0].has_value());
  REQUIRE(call.argNames[1].has_value());
  CHECK(*call.argNames[1] == "timeout");
  CHECK(call.args[2].kind == pyduino::Expr::Kind::Unsupported);
}

TEST_CASE("parses if elif else chains") {
  const std::string source = R"(if x > 1:
    a = 1
elif x > 0:
    a = 2
else:
    a = 3
)";
  const auto module = parseModule(source);
  REQUIRE(module.body.size() == 1);
  const auto &stmt = module.body[0];
  CHECK(stmt.kind == pyduino::Stmt::Kind::If);
  CHECK(stmt.isElif);
  CHECK(stmt.body.size() == 1);
  CHECK(stmt.line == 1);
  CHECK(stmt.endLine == 6);
  REQUIRE(stmt.orelse.size() == 1);
  const auto &elif = stmt.orelse[0];
  CHECK(elif.kind == pyduino::Stmt::Kind::If);
  CHECK(elif.line == 3);
  CHECK_FALSE(elif.isElif);
  REQUIRE(elif.orelse.size() == 1);
  CHECK(elif.orelse[0].kind == pyduino::Stmt::Kind::Assign);
}

TEST_CASE("parses loops") {
  const std::string source = R"(for i in range(10):
    tick(i)
while running:
    step()
else:
    stop()
)";
  const auto module = parseModule(source);
  REQUIRE(module.body.size() == 2);
  const auto &loop = module.body[0];
  CHECK(loop.kind == pyduino::Stmt::Kind::ForRange);
  REQUIRE(loop.targets.size() == 1);
  CHECK(loop.targets[0].name == "i");
  CHECK(loop.value->kind == pyduino::Expr::Kind::Call);
  CHECK(loop.body.size() == 1);
  const auto &whileLoop = module.body[1];
  CHECK(whileLoop.kind == pyduino::Stmt::Kind::While);
  CHECK(whileLoop.orelse.size() == 1);
}

TEST_CASE("parses function definitions with annotations and defaults") {
  const std::string source = R"(def add(a: int, b: float = 1.5) -> int:
    return a
)";
  const auto module = parseModule(source);
  REQUIRE(module.body.size() == 1);
  const auto &def = module.body[0];
  CHECK(def.kind == pyduino::Stmt::Kind::FunctionDef);
  CHECK(def.name == "add");
  REQUIRE(def.parameters.size() == 2);
  CHECK(def.parameters[0].name == "a");
  CHECK(def.parameters[0].annotation == "int");
  CHECK(def.parameters[1].annotation == "float");
  REQUIRE(def.parameters[1].defaultValue.has_value());
  CHECK(def.parameters[1].defaultValue->literalText == "1.5");
  CHECK(def.returnAnnotation == "int");
  REQUIRE(def.body.size() == 1);
  CHECK(def.body[0].kind == pyduino::Stmt::Kind::Return);
  CHECK(def.endLine == 2);
}

TEST_CASE("parses inline suites and semicolons") {
  const auto module = parseModule("def setup(): pass\na = 1; b = 2\n");
  REQUIRE(module.body.size() == 3);
  CHECK(module.body[0].kind == pyduino::Stmt::Kind::FunctionDef);
  REQUIRE(module.body[0].body.size() == 1);
  CHECK(module.body[0].body[0].kind == pyduino::Stmt::Kind::Pass);
  CHECK(module.body[1].targets[0].name == "a");
  CHECK(module.body[2].targets[0].name == "b");
}

TEST_CASE("parses imports") {
  const auto module = parseModule("from lib.CheapStepper import CheapStepper as Motor\nimport time, os.path\n");
  REQUIRE(module.body.size() == 2);
  const auto &from = module.body[0];
  CHECK(from.kind == pyduino::Stmt::Kind::Import);
  CHECK(from.isFromImport);
  CHECK(from.name == "lib.CheapStepper");
  REQUIRE(from.importedNames.size() == 1);
  CHECK(from.importedNames[0].name == "CheapStepper");
  CHECK(from.importedNames[0].alias == "Motor");
  const auto &plain = module.body[1];
  CHECK_FALSE(plain.isFromImport);
  REQUIRE(plain.importedNames.size() == 2);
  CHECK(plain.importedNames[1].name == "os.path");
}

TEST_CASE("treats annotated assignment as assignment") {
  const auto module = parseModule("count: int = 3\nlimit: int\n");
  REQUIRE(module.body.size() == 2);
  CHECK(module.body[0].kind == pyduino::Stmt::Kind::Assign);
  CHECK(module.body[0].targets[0].name == "count");
  CHECK(module.body[1].kind == pyduino::Stmt::Kind::Unsupported);
}

TEST_CASE("records augmented assignment operator") {
  const auto module = parseModule("x //= 2\n");
  REQUIRE(module.body.size() == 1);
  CHECK(module.body[0].kind == pyduino::Stmt::Kind::AugmentedAssign);
  CHECK(module.body[0].augOp == pyduino::BinaryOperator::FloorDiv);
}

TEST_CASE("records statement span across lines") {
  const auto module = parseModule("f(1,\n  2)\ng()\n");
  REQUIRE(module.body.size() == 2);
  CHECK(module.body[0].line == 1);
  CHECK(module.body[0].endLine == 2);
  CHECK(module.body[1].line == 3);
}

TEST_SUITE_END();
