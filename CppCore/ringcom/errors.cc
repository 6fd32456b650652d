// MIT License
// Copyright 2023--present ringcom developers

#include "ringcom/errors.hpp"

#include <fmt/core.h>

namespace ringcom {

namespace details {

/**
 * @details
 * Indices are one-based on every public surface; zero is never valid.
 */
void check_index(size_t idx, size_t n_atoms) {
  if (idx < 1 || idx > n_atoms) {
    throw Error(ErrorKind::IndexOutOfRange,
                fmt::format("Atom index {} out of range [1, {}]", idx,
                            n_atoms));
  }
}

} // namespace details

} // namespace ringcom
