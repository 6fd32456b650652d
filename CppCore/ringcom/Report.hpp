#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Console reporting of analysis results.
 *
 * Formats progress and descriptor lines with {fmt}. Everything is written to
 * the stream handed in, so callers choose stdout, a log, or a test buffer.
 */

#include <iosfwd>
#include <string>

#include "ringcom/Descriptors.hpp"
#include "ringcom/Structure.hpp"

namespace ringcom {
namespace report {

/**
 * @brief Prints ring sizes, centroids, marker summary and all descriptors.
 * @param out       Destination stream.
 * @param structure The annotated structure (with markers).
 * @param result    Output of @c RingAnalyzer.
 * @return Void.
 */
void printAnalysis(std::ostream &out, const Structure &structure,
                   const AnalysisResult &result);

/**
 * @brief Prints the closing line naming the written file.
 * @param out      Destination stream.
 * @param n_rings  Number of marker atoms added.
 * @param filename Path that was written.
 * @return Void.
 */
void printSaved(std::ostream &out, size_t n_rings, const std::string &filename);

} // namespace report
} // namespace ringcom
