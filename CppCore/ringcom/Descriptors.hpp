#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Plain structures for analysis input and results.
 *
 * Defines what the caller hands to the analyzer and the labelled
 * descriptor values it hands back to reporters and writers.
 */

#include <cstddef>
#include <optional>
#include <vector>

#include <Eigen/Dense>

#include "ringcom/ring_types.hpp"

namespace ringcom {

/**
 * @brief Ring and metal assignment supplied by the caller.
 * @ingroup ringcom
 *
 * All indices are one-based. @c ring2 is the middle ring when @c ring3 is
 * present and must then be listed in connectivity order.
 */
struct RingInput {
  Ring ring1;
  Ring ring2;
  std::optional<Ring> ring3;
  size_t metal1{0};
  std::optional<size_t> metal2;
};

struct DistanceDescriptor {
  size_t i, j;
  double value; //!< Å
};

struct AngleDescriptor {
  size_t i, j, k; //!< @c j is the vertex.
  double value;   //!< Degrees
};

struct DihedralDescriptor {
  size_t i, j, k, l;
  double value; //!< Signed degrees
};

/**
 * @brief Everything one analysis run produces.
 * @ingroup ringcom
 */
struct AnalysisResult {
  Topology topology{Topology::UNKNOWN};
  std::vector<size_t> ringSizes;           //!< In ring order.
  std::vector<Eigen::Vector3d> centroids;  //!< In ring order.
  std::vector<size_t> markers;             //!< One-based marker indices.
  size_t metal1{0};                        //!< After any swap.
  std::optional<size_t> metal2;            //!< After any swap.
  bool swapped{false};                     //!< Metal labels were exchanged.
  std::vector<DistanceDescriptor> distances;
  std::vector<DistanceDescriptor> bonds;   //!< Middle ring, cyclic.
  std::vector<DihedralDescriptor> dihedrals; //!< Middle ring, cyclic.
  std::vector<AngleDescriptor> angles;
};

} // namespace ringcom
