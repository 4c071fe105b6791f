// Tick labels demo: print tick positions and labels for a JSON configuration.
//
//   tick_labels_demo '{"kind":"angle","format":"dd:mm"}' 10.0 10.5
//   tick_labels_demo '{"kind":"scalar","format":"x.xx","spacing":0.1}' 0 0.35

#include "ct/config/LocatorConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

int main(int argc, char** argv) {
  if (argc != 4) {
    std::fprintf(stderr, "usage: %s <config-json> <min> <max>\n", argv[0]);
    return 2;
  }

  char* end = nullptr;
  double vmin = std::strtod(argv[2], &end);
  if (end == argv[2] || *end != '\0') {
    std::fprintf(stderr, "[tick_labels_demo] invalid min: %s\n", argv[2]);
    return 2;
  }
  double vmax = std::strtod(argv[3], &end);
  if (end == argv[3] || *end != '\0') {
    std::fprintf(stderr, "[tick_labels_demo] invalid max: %s\n", argv[3]);
    return 2;
  }

  auto res = ct::buildFormatterLocatorJson(argv[1]);
  if (!res.ok) {
    std::fprintf(stderr, "[tick_labels_demo] %s: %s\n",
                 res.err.code.c_str(), res.err.message.c_str());
    return 1;
  }

  auto ticks = res.locator->locate(vmin, vmax);
  auto labels = res.locator->format(ticks.values, ticks.spacing);

  std::printf("config:  %s\n", ct::serializeFormatterLocator(*res.locator).c_str());
  std::printf("spacing: %.12g\n", ticks.spacing);
  std::printf("ticks:   %zu\n", ticks.values.size());
  for (std::size_t i = 0; i < ticks.values.size(); i++) {
    std::printf("  %-20.12g %s\n", ticks.values[i], labels[i].c_str());
  }
  return 0;
}
