#pragma once

#include <string>

#include "clite/Ast.h"

namespace clite {

class AstPrinter {
public:
  std::string print(const Program &program) const;
};

} // namespace clite
