#pragma once

#include <vector>

#include "pyduino/Options.h"
#include "pyduino/TranslationUnit.h"

namespace pyduino {

extern const char *const kSetupName;
extern const char *const kLoopName;

// Ensures the unit defines setup and loop. A missing entry point gets an empty body; with autoLoop a
// missing loop calls every other procedure in declaration order.
void synthesizeEntryPoints(TranslationUnit &unit, const TranslateOptions &options);

// Functions in serialization order: setup, other procedures in declaration order, loop.
std::vector<const FunctionBlock *> orderedFunctions(const TranslationUnit &unit);

} // namespace pyduino
