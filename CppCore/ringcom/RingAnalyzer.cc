// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Implementation of the ring/metal analysis.
 */

// clang-format off
#include <utility>
// clang-format on
#include <fmt/core.h>

#include "ringcom/Geometry.hpp"
#include "ringcom/RingAnalyzer.hpp"
#include "ringcom/errors.hpp"

namespace ringcom {

RingAnalyzer::RingAnalyzer(RingInput input)
    : m_input(std::move(input)), m_topology(validate(m_input)) {}

/**
 * @details
 * Ring sizes are checked first, in ring order, so the reported ring is the
 * first offending one. The metal2 rule follows.
 */
Topology RingAnalyzer::validate(const RingInput &input) {
  auto checkSize = [](const Ring &ring, int label) {
    if (ring.size() < kMinRingSize || ring.size() > kMaxRingSize) {
      throw Error(ErrorKind::InvalidRingSize,
                  fmt::format("ring{} must have 5 or 6 atoms (got {})", label,
                              ring.size()));
    }
  };
  checkSize(input.ring1, 1);
  checkSize(input.ring2, 2);
  if (input.ring3) {
    checkSize(*input.ring3, 3);
  }

  if (input.ring3 && !input.metal2) {
    throw Error(ErrorKind::MissingMetal2,
                "metal2 required for 3-ring structure");
  }
  if (!input.ring3 && input.metal2) {
    throw Error(ErrorKind::ExtraMetal2,
                "metal2 specified but only 2 rings provided");
  }
  return input.ring3 ? Topology::ThreeRing : Topology::TwoRing;
}

std::vector<const Ring *> RingAnalyzer::rings() const {
  std::vector<const Ring *> result{&m_input.ring1, &m_input.ring2};
  if (m_input.ring3) {
    result.push_back(&*m_input.ring3);
  }
  return result;
}

void RingAnalyzer::checkIndices(const Structure &structure) const {
  const size_t n_atoms = structure.size();
  for (const Ring *ring : rings()) {
    for (size_t idx : *ring) {
      details::check_index(idx, n_atoms);
    }
  }
  details::check_index(m_input.metal1, n_atoms);
  if (m_input.metal2) {
    details::check_index(*m_input.metal2, n_atoms);
  }
}

AnalysisResult RingAnalyzer::operator()(Structure &structure) const {
  checkIndices(structure);

  AnalysisResult result;
  result.topology = m_topology;
  result.metal1 = m_input.metal1;
  result.metal2 = m_input.metal2;

  const auto ringList = rings();
  structure.reserve(structure.size() + ringList.size());
  for (const Ring *ring : ringList) {
    Eigen::Vector3d com = geom::centroid(structure, *ring);
    result.ringSizes.push_back(ring->size());
    result.centroids.push_back(com);
    result.markers.push_back(structure.addAtom(kMarkerSymbol, com));
  }

  if (m_topology == Topology::ThreeRing) {
    threeRingDescriptors(structure, result);
  } else {
    twoRingDescriptors(structure, result);
  }
  return result;
}

void RingAnalyzer::twoRingDescriptors(const Structure &structure,
                                      AnalysisResult &result) const {
  const size_t com1 = result.markers[0];
  const size_t com2 = result.markers[1];
  const size_t m1 = result.metal1;

  result.distances.push_back({m1, com2, geom::distance(structure, m1, com2)});
  result.angles.push_back(
      {com1, m1, com2, geom::angle(structure, com1, m1, com2)});
}

/**
 * @details
 * The metal relabelling is a single two-condition check: metal1 and metal2
 * are exchanged only when metal1 is strictly nearer ring3 than ring1 and
 * metal2 is strictly nearer ring1 than ring3. Ties and cases where both
 * metals favour the same ring keep the caller's order.
 */
void RingAnalyzer::threeRingDescriptors(const Structure &structure,
                                        AnalysisResult &result) const {
  const size_t com1 = result.markers[0];
  const size_t com2 = result.markers[1];
  const size_t com3 = result.markers[2];
  size_t m1 = result.metal1;
  size_t m2 = *result.metal2;

  double d_m1_r1 = geom::distance(structure, m1, com1);
  double d_m1_r3 = geom::distance(structure, m1, com3);
  double d_m2_r1 = geom::distance(structure, m2, com1);
  double d_m2_r3 = geom::distance(structure, m2, com3);

  if (d_m1_r3 < d_m1_r1 && d_m2_r1 < d_m2_r3) {
    std::swap(m1, m2);
    result.swapped = true;
  }
  result.metal1 = m1;
  result.metal2 = m2;

  auto addDistance = [&](size_t i, size_t j) {
    result.distances.push_back({i, j, geom::distance(structure, i, j)});
  };
  addDistance(m1, com1);
  addDistance(m1, com2);
  addDistance(m2, com2);
  addDistance(m2, com3);
  addDistance(m1, m2);

  const Ring &middle = m_input.ring2;
  const size_t n = middle.size();
  for (size_t i = 0; i < n; ++i) {
    size_t a = middle[i];
    size_t b = middle[(i + 1) % n];
    result.bonds.push_back({a, b, geom::distance(structure, a, b)});
  }
  for (size_t i = 0; i < n; ++i) {
    size_t a = middle[i];
    size_t b = middle[(i + 1) % n];
    size_t c = middle[(i + 2) % n];
    size_t d = middle[(i + 3) % n];
    result.dihedrals.push_back(
        {a, b, c, d, geom::dihedral(structure, a, b, c, d)});
  }

  auto addAngle = [&](size_t i, size_t j, size_t k) {
    result.angles.push_back({i, j, k, geom::angle(structure, i, j, k)});
  };
  addAngle(com1, m1, com2);
  addAngle(com1, com2, com3);
  addAngle(com2, m2, com3);
  addAngle(m1, com2, m2);
}

} // namespace ringcom
