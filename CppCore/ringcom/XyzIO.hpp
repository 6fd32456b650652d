#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Reading and writing of xyz structure files.
 *
 * Layout: atom count, a free-text comment line, then one
 * "symbol x y z" line per atom. Coordinates are written with six decimals.
 */

#include <iosfwd>
#include <string>

#include "ringcom/Structure.hpp"

namespace ringcom {
namespace io {

/// Comment line written when the caller does not give one.
constexpr const char *kDefaultComment = "Generated by ringcom";

/**
 * @brief Parses an xyz document.
 * @param in Stream positioned at the atom count line.
 * @return The parsed structure.
 * @throws ringcom::Error MalformedStructure on a bad count, a short file, or
 *         an atom line with fewer than four fields or non-numeric coordinates.
 */
Structure readXyz(std::istream &in);

/**
 * @brief Reads an xyz file from disk.
 * @param filename Path to the file.
 * @return The parsed structure.
 * @throws ringcom::Error FileNotFound if the file cannot be opened.
 */
Structure readXyz(const std::string &filename);

void writeXyz(std::ostream &out, const Structure &structure,
              const std::string &comment = kDefaultComment);

/**
 * @brief Writes a structure to disk, replacing any existing file.
 * @param filename Destination path.
 * @param structure Atoms to write, in order.
 * @param comment Text for the second line.
 * @return Void.
 * @throws ringcom::Error FileNotFound if the file cannot be created.
 */
void writeXyz(const std::string &filename, const Structure &structure,
              const std::string &comment = kDefaultComment);

} // namespace io
} // namespace ringcom
