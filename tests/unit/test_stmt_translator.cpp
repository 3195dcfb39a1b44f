#include "pyduino/Lexer.h"
#include "pyduino/Parser.h"
#include "pyduino/StmtTranslator.h"

#include <doctest/doctest.h>

namespace {
std::string renderBody(const std::string &source, int functionDepth = 1) {
  pyduino::Lexer lexer(source);
  pyduino::Parser parser(lexer.tokenize());
  pyduino::Module module;
  std::string error;
  REQUIRE(parser.parse(module, error));
  pyduino::TranslationContext context;
  context.functionDepth = functionDepth;
  std::vector<pyduino::EmittedLine> lines;
  pyduino::renderBlock(module.body, 0, context, lines);
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += "\n";
    }
    out += lines[i].text;
  }
  return out;
}
} // namespace

TEST_SUITE_BEGIN("pyduino.stmt");

TEST_CASE("renders if elif else with braces") {
  const std::string source = R"(if x > 1:
    a = 1
elif x > 0:
    a = 2
else:
    a = 3
)";
  CHECK(renderBody(source) == "if (x > 1) {\n"
                              "  a = 1;\n"
                              "} else if (x > 0) {\n"
                              "  a = 2;\n"
                              "} else {\n"
                              "  a = 3;\n"
                              "}");
}

TEST_CASE("wraps bare conditions") {
  CHECK(renderBody("if ready:\n    go()\n") == "if (ready) {\n  go();\n}");
  CHECK(renderBody("while True:\n    pass\n") == "while (true) {\n}");
  CHECK(renderBody("if 2 ** n:\n    pass\n") == "if (pow(2, n)) {\n}");
}

TEST_CASE("renders while loops with break and continue") {
  const std::string source = R"(while n < 10:
    n += 1
    if n == 3:
        continue
    break
)";
  CHECK(renderBody(source) == "while (n < 10) {\n"
                              "  n += 1;\n"
                              "  if (n == 3) {\n"
                              "    continue;\n"
                              "  }\n"
                              "  break;\n"
                              "}");
}

TEST_CASE("leaves placeholder for loop else clauses") {
  CHECK(renderBody("while x:\n    x -= 1\nelse:\n    done()\n") ==
        "while (x) {\n  x -= 1;\n}\n/* unsupported: while-else */");
  CHECK(renderBody("for i in range(3):\n    f(i)\nelse:\n    g()\n") ==
        "for (int i = 0; i < 3; i++) {\n  f(i);\n}\n/* unsupported: for-else */");
}

TEST_CASE("lowers range loops") {
  CHECK(renderBody("for i in range(5):\n    tick(i)\n") == "for (int i = 0; i < 5; i++) {\n  tick(i);\n}");
  CHECK(renderBody("for i in range(2, n + 1):\n    pass\n") == "for (int i = 2; i < (n + 1); i++) {\n}");
}

TEST_CASE("degrades other loop shapes to placeholders") {
  CHECK(renderBody("for i in range(0, 10, 2):\n    pass\n") == "/* unsupported: range with step */");
  CHECK(renderBody("for x in items:\n    use(x)\n") == "/* unsupported: for loop over non-range iterable */");
  CHECK(renderBody("for k, v in range(3):\n    pass\n") == "/* unsupported: for loop with tuple target */");
  CHECK(renderBody("for i in range():\n    pass\n") == "/* unsupported: range with 0 arguments */");
}

TEST_CASE("renders augmented assignment") {
  CHECK(renderBody("x += 1\n") == "x += 1;");
  CHECK(renderBody("x //= 2\n") == "x /= 2;");
  CHECK(renderBody("x <<= 1\n") == "x <<= 1;");
  CHECK(renderBody("x **= 2\n") == "x = pow(x, 2);");
  CHECK(renderBody("self.count -= 1\n") == "self.count -= 1;");
}

TEST_CASE("renders simple statements") {
  CHECK(renderBody("pass\n").empty());
  CHECK(renderBody("return\n") == "return;");
  CHECK(renderBody("return x + 1\n") == "return (x + 1);");
  CHECK(renderBody("Serial.println('hi')\n") == "Serial.println(\"hi\");");
}

TEST_CASE("renders assignments by declaration form") {
  CHECK(renderBody("speed = 5\n") == "speed = 5;");
  CHECK(renderBody("self.speed = 5\n") == "self.speed = 5;");
  CHECK(renderBody("a, b = 1, 2\n") == "/* unsupported: assignment to tuple */");
  CHECK(renderBody("items[0] = 1\n") == "/* unsupported: assignment to subscript */");
}

TEST_CASE("renders unsupported statements as placeholders") {
  CHECK(renderBody("del x\n") == "/* unsupported: del */");
  CHECK(renderBody("global counter\n") == "/* unsupported: global */");
  CHECK(renderBody("class A:\n    pass\n") == "/* unsupported: class */");
}

TEST_CASE("renders typed function definitions") {
  CHECK(renderBody("def blink(pin: int, times=3):\n    digitalWrite(pin, HIGH)\n", 0) ==
        "void blink(int pin, int times = 3) {\n  digitalWrite(pin, HIGH);\n}");
  CHECK(renderBody("def twice(x):\n    return x * 2\n", 0) == "int twice(int x) {\n  return (x * 2);\n}");
  CHECK(renderBody("def ratio(a: float) -> float:\n    return a / 2\n", 0) ==
        "float ratio(float a) {\n  return (a / 2);\n}");
  CHECK(renderBody("def show(msg: str, on: bool):\n    Serial.println(msg)\n", 0) ==
        "void show(String msg, bool on) {\n  Serial.println(msg);\n}");
}

TEST_CASE("infers int return from nested returns") {
  const std::string source = R"(def sign(x):
    if x < 0:
        return -1
    return 1
)";
  CHECK(renderBody(source, 0) == "int sign(int x) {\n"
                                 "  if (x < 0) {\n"
                                 "    return (-1);\n"
                                 "  }\n"
                                 "  return 1;\n"
                                 "}");
}

TEST_CASE("entry points are always void") {
  CHECK(renderBody("def setup() -> int:\n    return 1\n", 0) == "void setup() {\n  return 1;\n}");
  CHECK(renderBody("def loop():\n    pass\n", 0) == "void loop() {\n}");
}

TEST_CASE("nested function definitions are unsupported") {
  CHECK(renderBody("def outer():\n    def inner():\n        pass\n    inner()\n", 0) ==
        "void outer() {\n  /* unsupported: nested function inner */\n  inner();\n}");
  CHECK(renderBody("while True:\n    def tick():\n        pass\n", 0) ==
        "while (true) {\n  /* unsupported: nested function tick */\n}");
  CHECK(renderBody("if ready:\n    pass\nelse:\n    def fallback():\n        pass\n", 0) ==
        "if (ready) {\n} else {\n  /* unsupported: nested function fallback */\n}");
  CHECK(renderBody("for i in range(2):\n    def step():\n        pass\n", 0) ==
        "for (int i = 0; i < 2; i++) {\n  /* unsupported: nested function step */\n}");
}

TEST_CASE("drops defaults that precede required parameters") {
  CHECK(renderBody("def f(a, b=2, *c, **d):\n    pass\n", 0) == "void f(int a, int b, int c, int d) {\n}");
  CHECK(renderBody("def g(a, b=2, c=3):\n    pass\n", 0) == "void g(int a, int b = 2, int c = 3) {\n}");
  CHECK(renderBody("def h(a=1, *, b):\n    pass\n", 0) == "void h(int a, int b) {\n}");
}

TEST_CASE("maps annotations to target types") {
  CHECK(pyduino::mapTypeAnnotation("int") == "int");
  CHECK(pyduino::mapTypeAnnotation("float") == "float");
  CHECK(pyduino::mapTypeAnnotation("bool") == "bool");
  CHECK(pyduino::mapTypeAnnotation("str") == "String");
  CHECK(pyduino::mapTypeAnnotation("None") == "void");
  CHECK(pyduino::mapTypeAnnotation("") == "int");
  CHECK(pyduino::mapTypeAnnotation("list") == "int");
}

TEST_SUITE_END();
