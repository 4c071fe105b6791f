#include "ct/core/Diagnostics.hpp"
#include <cstdio>

namespace ct {

void logDiagnostic(const Diagnostic& d) {
  std::fprintf(stderr, "[%s] warning: %s\n", d.component.c_str(), d.message.c_str());
}

} // namespace ct
