#pragma once

#include <string>
#include <vector>

namespace pyduino {
struct TranslateOptions {
  bool autoLoop = false;
  bool emitComments = true;
  bool constructAnyCall = false;
  std::vector<std::string> constructibleTypes;
};

struct Options {
  std::string command;
  std::string inputPath;
  std::string outputPath;
  std::string dumpStage;
  std::string port;
  std::string fqbn = "arduino:avr:uno";
  std::string arduinoCli;
  std::string projectName;
  TranslateOptions translate;
};
} // namespace pyduino
