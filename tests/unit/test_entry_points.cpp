#include "pyduino/EntryPoints.h"

#include <doctest/doctest.h>

namespace {
pyduino::FunctionBlock makeBlock(const std::string &name) {
  pyduino::FunctionBlock block;
  block.name = name;
  block.lines = {"void " + name + "() {", "}"};
  return block;
}

std::vector<std::string> orderedNames(const pyduino::TranslationUnit &unit) {
  std::vector<std::string> names;
  for (const auto *block : pyduino::orderedFunctions(unit)) {
    names.push_back(block->name);
  }
  return names;
}
} // namespace

TEST_SUITE_BEGIN("pyduino.entry_points");

TEST_CASE("synthesizes missing setup and loop") {
  pyduino::TranslationUnit unit;
  pyduino::synthesizeEntryPoints(unit, {});
  REQUIRE(unit.functions.size() == 2);
  const auto *setup = unit.findFunction("setup");
  const auto *loop = unit.findFunction("loop");
  REQUIRE(setup != nullptr);
  REQUIRE(loop != nullptr);
  CHECK(setup->synthesized);
  CHECK(setup->lines == std::vector<std::string>{"void setup() {", "}"});
  CHECK(loop->lines == std::vector<std::string>{"void loop() {", "}"});
}

TEST_CASE("keeps existing entry points") {
  pyduino::TranslationUnit unit;
  auto loop = makeBlock("loop");
  loop.lines = {"void loop() {", "  step();", "}"};
  unit.defineFunction(loop);
  pyduino::TranslateOptions options;
  options.autoLoop = true;
  pyduino::synthesizeEntryPoints(unit, options);
  REQUIRE(unit.findFunction("loop") != nullptr);
  CHECK_FALSE(unit.findFunction("loop")->synthesized);
  CHECK(unit.findFunction("loop")->lines.size() == 3);
  CHECK(unit.functions.size() == 2);
}

TEST_CASE("auto loop calls other procedures in declaration order") {
  pyduino::TranslationUnit unit;
  unit.defineFunction(makeBlock("blink"));
  unit.defineFunction(makeBlock("setup"));
  unit.defineFunction(makeBlock("readSensor"));
  pyduino::TranslateOptions options;
  options.autoLoop = true;
  pyduino::synthesizeEntryPoints(unit, options);
  const auto *loop = unit.findFunction("loop");
  REQUIRE(loop != nullptr);
  CHECK(loop->lines == std::vector<std::string>{"void loop() {", "  blink();", "  readSensor();", "}"});
}

TEST_CASE("orders setup first and loop last") {
  pyduino::TranslationUnit unit;
  unit.defineFunction(makeBlock("helper"));
  unit.defineFunction(makeBlock("loop"));
  unit.defineFunction(makeBlock("other"));
  unit.defineFunction(makeBlock("setup"));
  CHECK(orderedNames(unit) == std::vector<std::string>{"setup", "helper", "other", "loop"});
}

TEST_CASE("redefinition replaces the block in place") {
  pyduino::TranslationUnit unit;
  unit.defineFunction(makeBlock("a"));
  unit.defineFunction(makeBlock("b"));
  auto replacement = makeBlock("a");
  replacement.lines = {"void a() {", "  second();", "}"};
  unit.defineFunction(replacement);
  REQUIRE(unit.functions.size() == 2);
  CHECK(unit.functions[0].name == "a");
  CHECK(unit.functions[0].lines[1] == "  second();");
}

TEST_SUITE_END();
