#pragma once

#include <string>
#include <vector>

#include "clite/Interpreter.h"
#include "clite/Parser.h"

namespace clite {
struct RunOptions {
  std::string inputPath;
  std::string entryName = "main";
  bool callEntry = true;
  std::string dumpStage;
  int maxCallDepth = kDefaultMaxCallDepth;
  int maxParseDepth = kDefaultMaxParseDepth;
};

struct LintOptions {
  std::vector<std::string> inputPaths;
  bool failOnWarn = false;
};
} // namespace clite
