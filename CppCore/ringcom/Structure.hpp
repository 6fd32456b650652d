#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Header file for the Structure class.
 *
 * The structure is the ordered, append-only list of atoms (element symbol and
 * Cartesian position) that the analysis reads from and grows with marker
 * atoms. Every public index is one-based.
 */

// clang-format off
#include <string>
#include <vector>
// clang-format on
#include <Eigen/Dense>

#include "ringcom/types/AtomMatrix.hpp"

namespace ringcom {

/**
 * @class Structure
 * @brief Owned, append-only collection of atoms.
 * @ingroup ringcom
 *
 * Symbols and positions are kept in lock step: every append adds exactly one
 * symbol and one position row.
 */
class Structure {
public:
  Structure() = default;

  /**
   * @brief Appends an atom at the end of the structure.
   * @param symbol   Element (or marker) symbol.
   * @param position Cartesian position in Å.
   * @return One-based index of the new atom.
   */
  size_t addAtom(const std::string &symbol, const Eigen::Vector3d &position);

  /**
   * @brief Reserves storage for a known final size.
   * @param n_atoms Expected number of atoms.
   * @return Void.
   */
  void reserve(size_t n_atoms);

  /**
   * @brief Number of atoms currently held.
   * @return Atom count.
   */
  [[nodiscard]] size_t size() const { return m_symbols.size(); }

  [[nodiscard]] bool empty() const { return m_symbols.empty(); }

  /**
   * @brief Symbol of an atom.
   * @param idx One-based atom index.
   * @return The stored symbol.
   * @throws ringcom::Error (IndexOutOfRange) for an invalid index.
   */
  [[nodiscard]] const std::string &symbol(size_t idx) const;

  /**
   * @brief Position of an atom.
   * @param idx One-based atom index.
   * @return The position as a copy.
   * @throws ringcom::Error (IndexOutOfRange) for an invalid index.
   */
  [[nodiscard]] Eigen::Vector3d position(size_t idx) const;

  /**
   * @brief Label used in reports, e.g. "Fe11".
   * @param idx One-based atom index.
   * @return Symbol followed by the index.
   */
  [[nodiscard]] std::string label(size_t idx) const;

  /**
   * @brief Read-only view of all positions (one row per atom).
   * @return Const reference to the position matrix.
   */
  [[nodiscard]] const types::AtomMatrix &positions() const {
    return m_positions;
  }

  /**
   * @brief Read-only view of all symbols.
   * @return Const reference to the symbol list.
   */
  [[nodiscard]] const std::vector<std::string> &symbols() const {
    return m_symbols;
  }

private:
  std::vector<std::string> m_symbols; //!< One symbol per atom.
  types::AtomMatrix m_positions;      //!< One xyz row per atom.
};

} // namespace ringcom
