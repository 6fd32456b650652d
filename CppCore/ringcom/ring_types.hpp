/**
 * @brief Basic vocabulary types for ring descriptions.
 *
 * Defines the ring index list and the supported sandwich topologies that
 * decide which descriptor set the analyzer assembles.
 */

#pragma once
// MIT License
// Copyright 2023--present ringcom developers

#include <cstddef>
#include <vector>

namespace ringcom {

/**
 * @brief One-based atom indices of a ring, in connectivity order.
 */
using Ring = std::vector<size_t>;

/**
 * @brief Sandwich topologies understood by the analyzer.
 */
enum class Topology {
  UNKNOWN = 0, //!<  Not determined yet.
  TwoRing,     //!<  Metallocene: one metal between two rings.
  ThreeRing    //!<  Inverse sandwich: two metals around a middle ring.
};

/// Smallest ring size accepted.
constexpr size_t kMinRingSize = 5;
/// Largest ring size accepted.
constexpr size_t kMaxRingSize = 6;

/// Symbol given to atoms placed at ring centroids.
constexpr const char *kMarkerSymbol = "X";

} // namespace ringcom
