// MIT License
// Copyright 2023--present ringcom developers

#include <fmt/core.h>
#include <fmt/ostream.h>

#include "ringcom/RingAnalyzer.hpp"
#include "ringcom/Report.hpp"
#include "ringcom/XyzIO.hpp"
#include "ringcom/cli/Run.hpp"
#include "ringcom/errors.hpp"

namespace ringcom {
namespace cli {

int run(const Options &opts, std::ostream &out, std::ostream &err) {
  try {
    // Ring sizes and the metal2 rule are checked before the file is touched.
    RingAnalyzer analyzer(opts.ringInput());
    Structure structure = io::readXyz(opts.input);
    AnalysisResult result = analyzer(structure);

    const std::string output = opts.outputPath();
    if (!opts.quiet) {
      report::printAnalysis(out, structure, result);
    }
    io::writeXyz(output, structure);
    if (!opts.quiet) {
      report::printSaved(out, result.markers.size(), output);
    }
  } catch (const Error &e) {
    fmt::print(err, "Error: {}\n", e.what());
    return 1;
  }
  return 0;
}

} // namespace cli
} // namespace ringcom
