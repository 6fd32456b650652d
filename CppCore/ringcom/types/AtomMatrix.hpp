#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Definition of the native AtomMatrix class.
 *
 * A row-major matrix holding one row per atom. Rows can only be appended,
 * never removed or reordered, which is the growth model the structure store
 * relies on when marker atoms are inserted.
 */

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace ringcom {
namespace types {

/**
 * @class AtomMatrix
 * @brief A lightweight, append-only row-major matrix for atomic data.
 */
class AtomMatrix {
public:
  /**
   * @brief Constructs an empty matrix with a fixed row width.
   * @param cols  Number of columns every row will carry.
   */
  explicit AtomMatrix(size_t cols = 3) : m_rows(0), m_cols(cols) {}

  /**
   * @brief Constructor for list initialization.
   * @param list  The nested initializer list; all rows must share a width.
   */
  AtomMatrix(std::initializer_list<std::initializer_list<double>> list)
      : m_rows(0), m_cols(list.size() ? list.begin()->size() : 3) {
    m_data.reserve(list.size() * m_cols);
    for (const auto &rowList : list) {
      appendRow(rowList);
    }
  }

  /**
   * @brief Appends one row at the end of the matrix.
   * @param row  Values for the new row.
   * @return Index (zero-based) of the new row.
   */
  size_t appendRow(std::initializer_list<double> row) {
    return appendRow(row.begin(), row.size());
  }

  /**
   * @brief Appends one row from a raw buffer.
   * @param values  Pointer to @a count values.
   * @param count   Number of values, must equal @c cols().
   * @return Index (zero-based) of the new row.
   */
  size_t appendRow(const double *values, size_t count) {
    if (count != m_cols) {
      throw std::invalid_argument("AtomMatrix row width mismatch");
    }
    m_data.insert(m_data.end(), values, values + count);
    return m_rows++;
  }

  /**
   * @brief Reserves storage for @a rows rows.
   * @param rows  Expected final row count.
   * @return Void.
   */
  void reserveRows(size_t rows) { m_data.reserve(rows * m_cols); }

  const double &operator()(size_t row, size_t col) const {
    return m_data[row * m_cols + col];
  }

  size_t rows() const { return m_rows; }
  size_t cols() const { return m_cols; }
  size_t size() const { return m_rows * m_cols; }

  /**
   * @brief Fetches a pointer to the start of a row.
   * @param row  Zero-based row index.
   * @return Const raw pointer to @c cols() contiguous values.
   */
  const double *row_data(size_t row) const {
    return m_data.data() + row * m_cols;
  }

private:
  size_t m_rows; //!< The number of rows in the matrix.
  size_t m_cols; //!< The number of columns in the matrix.
  std::vector<double>
      m_data; //!< The underlying flat container for row-major data.
};

} // namespace types
} // namespace ringcom
