// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Implementation of the xyz reader and writer.
 */

// clang-format off
#include <fstream>
#include <sstream>
#include <vector>
// clang-format on
#include <fmt/core.h>
#include <fmt/ostream.h>

#include "ringcom/XyzIO.hpp"
#include "ringcom/errors.hpp"

namespace ringcom {
namespace io {

namespace {

Error malformed(const std::string &msg) {
  return Error(ErrorKind::MalformedStructure,
               fmt::format("Invalid XYZ format: {}", msg));
}

double parseCoordinate(const std::string &field, size_t line_no) {
  size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(field, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != field.size()) {
    throw malformed(
        fmt::format("bad coordinate '{}' on line {}", field, line_no));
  }
  return value;
}

} // namespace

/**
 * @details
 * Lines after the declared atoms are ignored. Fields beyond the fourth on an
 * atom line are ignored as well.
 */
Structure readXyz(std::istream &in) {
  std::string line;
  if (!std::getline(in, line)) {
    throw malformed("missing atom count");
  }

  long long n_atoms = -1;
  {
    std::istringstream count_stream(line);
    std::string rest;
    if (!(count_stream >> n_atoms) || (count_stream >> rest) || n_atoms < 0) {
      throw malformed(fmt::format("bad atom count '{}'", line));
    }
  }

  if (!std::getline(in, line)) {
    throw malformed("missing comment line");
  }

  // The declared count is untrusted; the store grows line by line.
  Structure structure;
  for (long long i = 0; i < n_atoms; ++i) {
    const size_t line_no = static_cast<size_t>(i) + 3;
    if (!std::getline(in, line)) {
      throw malformed(fmt::format("expected {} atoms, found {}", n_atoms, i));
    }
    std::istringstream fields_stream(line);
    std::vector<std::string> fields;
    std::string field;
    while (fields_stream >> field) {
      fields.push_back(field);
    }
    if (fields.size() < 4) {
      throw malformed(fmt::format("line {} has {} fields, need 4", line_no,
                                  fields.size()));
    }
    Eigen::Vector3d pos(parseCoordinate(fields[1], line_no),
                        parseCoordinate(fields[2], line_no),
                        parseCoordinate(fields[3], line_no));
    structure.addAtom(fields[0], pos);
  }
  return structure;
}

Structure readXyz(const std::string &filename) {
  std::ifstream in(filename);
  if (!in) {
    throw Error(ErrorKind::FileNotFound,
                fmt::format("File '{}' not found.", filename));
  }
  return readXyz(in);
}

void writeXyz(std::ostream &out, const Structure &structure,
              const std::string &comment) {
  fmt::print(out, "{}\n{}\n", structure.size(), comment);
  const auto &pos = structure.positions();
  for (size_t i = 0; i < structure.size(); ++i) {
    fmt::print(out, "{} {:.6f} {:.6f} {:.6f}\n", structure.symbols()[i],
               pos(i, 0), pos(i, 1), pos(i, 2));
  }
}

void writeXyz(const std::string &filename, const Structure &structure,
              const std::string &comment) {
  std::ofstream out(filename);
  if (!out) {
    throw Error(ErrorKind::FileNotFound,
                fmt::format("Unable to open '{}' for writing.", filename));
  }
  writeXyz(out, structure, comment);
  out.flush();
  if (!out) {
    throw Error(ErrorKind::FileNotFound,
                fmt::format("Failed while writing '{}'.", filename));
  }
}

} // namespace io
} // namespace ringcom
