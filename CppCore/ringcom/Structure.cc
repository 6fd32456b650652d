// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Implementation of the append-only structure store.
 */

#include "ringcom/Structure.hpp"

#include <fmt/core.h>

#include "ringcom/errors.hpp"
#include "ringcom/types/adapters/eigen.hpp"

namespace ringcom {

size_t Structure::addAtom(const std::string &symbol,
                          const Eigen::Vector3d &position) {
  types::adapt::eigen::appendVector3d(m_positions, position);
  m_symbols.push_back(symbol);
  return m_symbols.size();
}

void Structure::reserve(size_t n_atoms) {
  m_symbols.reserve(n_atoms);
  m_positions.reserveRows(n_atoms);
}

const std::string &Structure::symbol(size_t idx) const {
  details::check_index(idx, size());
  return m_symbols[idx - 1];
}

Eigen::Vector3d Structure::position(size_t idx) const {
  details::check_index(idx, size());
  return types::adapt::eigen::rowToVector3d(m_positions, idx - 1);
}

std::string Structure::label(size_t idx) const {
  return fmt::format("{}{}", symbol(idx), idx);
}

} // namespace ringcom
