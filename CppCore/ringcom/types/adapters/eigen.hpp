#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Conversion utilities between Eigen and native types.
 *
 * The geometry code works on @c Eigen::Vector3d while positions live in the
 * native @c AtomMatrix. These inline adapters move data across that seam.
 */

// clang-format off
#include <Eigen/Dense>
// clang-format on
#include <vector>

#include "ringcom/types/AtomMatrix.hpp"

namespace ringcom {
namespace types {
namespace adapt {
namespace eigen {

/**
 * @brief Copies one row of a 3-column matrix into a vector.
 * @param matrix  Source matrix, must have three columns.
 * @param row     Zero-based row index.
 * @return The row as an @c Eigen::Vector3d.
 */
inline Eigen::Vector3d rowToVector3d(const AtomMatrix &matrix, size_t row) {
  return Eigen::Map<const Eigen::Vector3d>(matrix.row_data(row));
}

/**
 * @brief Appends a 3D point as a new row.
 * @param matrix  Destination matrix, must have three columns.
 * @param point   The point to append.
 * @return Zero-based index of the new row.
 */
inline size_t appendVector3d(AtomMatrix &matrix, const Eigen::Vector3d &point) {
  return matrix.appendRow(point.data(), 3);
}

/**
 * @brief Gathers selected rows into an Eigen matrix.
 * @param matrix  Source matrix with three columns.
 * @param rows    Zero-based row indices, in the order they should appear.
 * @return An N x 3 @c Eigen matrix with copied data.
 */
inline Eigen::Matrix<double, Eigen::Dynamic, 3>
gatherRows(const AtomMatrix &matrix, const std::vector<size_t> &rows) {
  Eigen::Matrix<double, Eigen::Dynamic, 3> result(rows.size(), 3);
  for (size_t i = 0; i < rows.size(); ++i) {
    result.row(static_cast<Eigen::Index>(i)) =
        rowToVector3d(matrix, rows[i]).transpose();
  }
  return result;
}

} // namespace eigen
} // namespace adapt
} // namespace types
} // namespace ringcom
