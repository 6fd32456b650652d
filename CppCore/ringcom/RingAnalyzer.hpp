#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Header file for the RingAnalyzer class.
 *
 * The analyzer validates a ring/metal assignment, inserts one marker atom per
 * ring centroid and assembles the descriptor set belonging to the two-ring
 * (metallocene) or three-ring (inverse sandwich) topology.
 */

// clang-format off
#include <vector>
// clang-format on
#include "ringcom/Descriptors.hpp"
#include "ringcom/Structure.hpp"
#include "ringcom/ring_types.hpp"

namespace ringcom {

/**
 * @class RingAnalyzer
 * @brief Orchestrates centroid insertion and descriptor assembly.
 * @ingroup ringcom
 *
 * Construction checks everything that does not need atoms (ring sizes and
 * the metal2 rule). The call operator checks indices against the structure,
 * then mutates it. A failed check never leaves markers behind.
 */
class RingAnalyzer {
public:
  /**
   * @brief Validates and stores a ring/metal assignment.
   * @param input Rings and metals, one-based.
   * @throws ringcom::Error InvalidRingSize, MissingMetal2 or ExtraMetal2.
   */
  explicit RingAnalyzer(RingInput input);

  /**
   * @brief Runs the analysis on a structure.
   *
   * Appends one marker atom ("X") per ring, in ring order, then computes the
   * descriptors from the grown structure.
   *
   * @param structure The structure to annotate; grows by the ring count.
   * @return The collected descriptors.
   * @throws ringcom::Error IndexOutOfRange before any mutation, or
   *         DegenerateGeometry from the geometry kernel.
   */
  AnalysisResult operator()(Structure &structure) const;

  /**
   * @brief Checks ring sizes and the metal2 rule.
   * @param input The assignment to check.
   * @return The topology implied by the assignment.
   */
  static Topology validate(const RingInput &input);

  [[nodiscard]] Topology topology() const { return m_topology; }

  /**
   * @brief Rings in input order, labelled ring1, ring2[, ring3].
   * @return Pointers into the stored input.
   */
  [[nodiscard]] std::vector<const Ring *> rings() const;

private:
  void checkIndices(const Structure &structure) const;
  void twoRingDescriptors(const Structure &structure,
                          AnalysisResult &result) const;
  void threeRingDescriptors(const Structure &structure,
                            AnalysisResult &result) const;

  RingInput m_input;   //!< Validated assignment.
  Topology m_topology; //!< Derived from the presence of ring3.
};

} // namespace ringcom
