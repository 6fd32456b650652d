#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @file errors.hpp
 * @brief Exception type and error categories for ringcom.
 *
 * Every failure inside the library is reported by throwing
 * @c ringcom::Error. The category is carried alongside the message so the
 * command line boundary (and the tests) can tell failures apart without
 * parsing text.
 *
 * @ingroup ringcom
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ringcom {

/**
 * @brief Categories of fatal failures.
 */
enum class ErrorKind {
  FileNotFound,       //!< Input could not be opened (or output created).
  MalformedStructure, //!< Atom count or column layout mismatch in an xyz file.
  IndexOutOfRange,    //!< Ring or metal index outside [1, atom count].
  InvalidRingSize,    //!< Ring length is not 5 or 6.
  MissingMetal2,      //!< Three rings given without a second metal.
  ExtraMetal2,        //!< Second metal given with only two rings.
  DegenerateGeometry, //!< Collinear or coincident points in an angle/dihedral.
  InvalidArgument     //!< Malformed command line.
};

/**
 * @class Error
 * @brief Exception thrown for every fatal ringcom failure.
 * @ingroup ringcom
 */
class Error : public std::runtime_error {
public:
  /**
   * @brief Construct with a category and description.
   * @param kind Failure category.
   * @param msg  Description surfaced to the caller.
   */
  Error(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), m_kind(kind) {}

  /**
   * @brief Fetches the failure category.
   * @return The error kind.
   */
  [[nodiscard]] ErrorKind kind() const { return m_kind; }

private:
  ErrorKind m_kind; //!< Category of the failure.
};

namespace details {

/**
 * @brief Throws @c IndexOutOfRange unless @a idx lies in [1, @a n_atoms].
 * @param idx One-based atom index.
 * @param n_atoms Number of atoms available.
 * @return Void.
 */
void check_index(size_t idx, size_t n_atoms);

} // namespace details

} // namespace ringcom
