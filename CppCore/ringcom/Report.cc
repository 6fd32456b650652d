// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Implementation of the console reporter.
 */

// clang-format off
#include <algorithm>
#include <ostream>
// clang-format on
#include <fmt/core.h>
#include <fmt/ostream.h>

#include "ringcom/Report.hpp"

namespace ringcom {
namespace report {

namespace {

/**
 * @brief Names atoms for report lines; markers become CoM<n>.
 */
class Labeler {
public:
  Labeler(const Structure &structure, const AnalysisResult &result)
      : m_structure(structure), m_result(result) {}

  /// Ring number (1-based) if @a idx is a marker, else 0.
  size_t ringOf(size_t idx) const {
    auto it =
        std::find(m_result.markers.begin(), m_result.markers.end(), idx);
    if (it == m_result.markers.end()) {
      return 0;
    }
    return static_cast<size_t>(it - m_result.markers.begin()) + 1;
  }

  std::string shortName(size_t idx) const {
    size_t ring = ringOf(idx);
    return ring ? fmt::format("CoM{}", ring) : m_structure.label(idx);
  }

  std::string longName(size_t idx) const {
    size_t ring = ringOf(idx);
    return ring ? fmt::format("Ring {} centroid", ring)
                : m_structure.label(idx);
  }

private:
  const Structure &m_structure;
  const AnalysisResult &m_result;
};

} // namespace

void printAnalysis(std::ostream &out, const Structure &structure,
                   const AnalysisResult &result) {
  Labeler names(structure, result);

  for (size_t r = 0; r < result.ringSizes.size(); ++r) {
    fmt::print(out, "ring{} detected as a {}-membered ring.\n", r + 1,
               result.ringSizes[r]);
  }
  for (size_t r = 0; r < result.centroids.size(); ++r) {
    const auto &c = result.centroids[r];
    fmt::print(out, "Ring {} centroid: {:.4f}, {:.4f}, {:.4f}\n", r + 1, c.x(),
               c.y(), c.z());
  }
  fmt::print(out, "Added {} dummy atoms ('X') at ring centroids.\n",
             result.markers.size());

  if (result.swapped) {
    fmt::print(out, "Note: Swapped metal1 and metal2 based on proximity to "
                    "ring1 and ring3.\n");
  }

  for (const auto &d : result.distances) {
    fmt::print(out, "Distance from {} to {}: {:.4f} Å\n", names.longName(d.i),
               names.longName(d.j), d.value);
  }

  if (!result.bonds.empty()) {
    fmt::print(out, "\nBond distances in middle ring (ring2):\n");
    for (const auto &b : result.bonds) {
      fmt::print(out, "Distance {}--{}: {:.4f} Å\n", structure.label(b.i),
                 structure.label(b.j), b.value);
    }
  }
  if (!result.dihedrals.empty()) {
    fmt::print(out, "\nDihedral angles in middle ring (ring2):\n");
    for (const auto &d : result.dihedrals) {
      fmt::print(out, "Dihedral {}-{}-{}-{}: {:.2f} degrees\n",
                 structure.label(d.i), structure.label(d.j),
                 structure.label(d.k), structure.label(d.l), d.value);
    }
  }

  for (const auto &a : result.angles) {
    fmt::print(out, "Angle {}-{}-{}: {:.2f} degrees\n", names.shortName(a.i),
               names.shortName(a.j), names.shortName(a.k), a.value);
  }
}

void printSaved(std::ostream &out, size_t n_rings,
                const std::string &filename) {
  fmt::print(out, "Modified structure with {} dummy atoms saved to '{}'.\n",
             n_rings, filename);
}

} // namespace report
} // namespace ringcom
