#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Command line options for the ringcom_analyze program.
 */

#include <optional>
#include <string>
#include <vector>

#include "ringcom/Descriptors.hpp"
#include "ringcom/ring_types.hpp"

namespace ringcom {
namespace cli {

/**
 * @brief Parsed command line.
 *
 * Only syntax and required options are enforced here; ring sizes and the
 * metal2 rule are left to @c RingAnalyzer.
 */
struct Options {
  std::string input;
  Ring ring1;
  Ring ring2;
  std::optional<Ring> ring3;
  std::optional<size_t> metal1;
  std::optional<size_t> metal2;
  std::string output; //!< Empty means "derive from input".
  bool quiet{false};
  bool help{false};

  /**
   * @brief Output path, falling back to @c defaultOutputPath(input).
   * @return The path to write.
   */
  [[nodiscard]] std::string outputPath() const;

  /**
   * @brief Ring/metal assignment for the analyzer.
   * @return The analyzer input.
   */
  [[nodiscard]] RingInput ringInput() const;
};

/**
 * @brief Parses the program arguments.
 * @param argc Argument count, as given to @c main.
 * @param argv Argument vector, as given to @c main.
 * @return The parsed options. @c help is set and nothing else is checked
 *         when -h/--help appears.
 * @throws ringcom::Error InvalidArgument on unknown flags, malformed
 *         indices, or missing required options.
 */
Options parseArgs(int argc, const char *const argv[]);

/**
 * @brief Input stem with "_analyzed" before the extension.
 *
 * "m.xyz" becomes "m_analyzed.xyz"; "dir/m" becomes "dir/m_analyzed".
 *
 * @param input The input path.
 * @return The derived output path.
 */
std::string defaultOutputPath(const std::string &input);

/**
 * @brief Help text.
 * @param program Name to show in the usage line.
 * @return Multi-line usage string.
 */
std::string usage(const std::string &program);

} // namespace cli
} // namespace ringcom
