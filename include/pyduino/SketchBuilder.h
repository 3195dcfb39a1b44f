#pragma once

#include <string>
#include <vector>

namespace pyduino {

struct CommandResult {
  int exitCode = -1;
  std::string output;
};

struct UploadResult {
  std::string sketchDir;
  std::string port;
  std::string logPath;
  std::string output;
};

// Drives the external arduino-cli tool. Every operation reports failures through `error` and leaves
// the sketch written next to the input untouched.
class SketchBuilder {
public:
  explicit SketchBuilder(std::string arduinoCli = "");

  const std::string &arduinoCli() const { return arduinoCli_; }

  bool stageSketch(const std::string &inputPath,
                   const std::string &sketch,
                   std::string &sketchDir,
                   std::string &error) const;
  bool detectPort(std::string &port, std::string &error) const;
  bool upload(const std::string &inputPath,
              const std::string &sketch,
              const std::string &port,
              const std::string &fqbn,
              UploadResult &result,
              std::string &error) const;
  bool listPorts(std::string &output, std::string &error) const;
  bool setupAvr(std::string &output, std::string &error) const;

private:
  bool runTool(const std::vector<std::string> &args, CommandResult &result, std::string &error) const;

  std::string arduinoCli_;
};

// Runs a shell command with stderr folded into stdout.
bool runCapture(const std::string &command, CommandResult &result, std::string &error);
std::string quoteShellArg(const std::string &text);

// First column of the first `board list` row naming a serial device, or empty.
std::string findPortInBoardList(const std::string &listing);
// Header names from `#include "..."` lines.
std::vector<std::string> includedHeaders(const std::string &sketch);
std::string uploadLogPath(const std::string &sketchDir, const std::string &timestamp);
std::string currentTimestamp();
// deps/arduino-cli under the working directory when present, otherwise arduino-cli from PATH.
std::string defaultArduinoCli();

} // namespace pyduino
