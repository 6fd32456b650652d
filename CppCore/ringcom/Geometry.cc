// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Implementation of the geometry kernel.
 */

// clang-format off
#include <algorithm>
#include <cmath>
// clang-format on

#include "ringcom/Geometry.hpp"
#include "ringcom/errors.hpp"
#include "ringcom/types/adapters/eigen.hpp"

namespace ringcom {
namespace geom {

namespace {

double toDegrees(double rad) { return rad * 180.0 / M_PI; }

double clampedAcosDeg(double cos_theta) {
  return toDegrees(std::acos(std::clamp(cos_theta, -1.0, 1.0)));
}

Eigen::Vector3d normalized(const Eigen::Vector3d &v, const char *what) {
  double norm = v.norm();
  if (norm < kDegenerateTol) {
    throw Error(ErrorKind::DegenerateGeometry, what);
  }
  return v / norm;
}

} // namespace

/**
 * @details
 * Indices are validated before any position is read, then the ring rows are
 * gathered into an N x 3 matrix and averaged column-wise.
 */
Eigen::Vector3d centroid(const Structure &structure, const Ring &ring) {
  if (ring.empty()) {
    throw Error(ErrorKind::InvalidRingSize,
                "Cannot take the centroid of an empty ring");
  }
  std::vector<size_t> rows;
  rows.reserve(ring.size());
  for (size_t idx : ring) {
    details::check_index(idx, structure.size());
    rows.push_back(idx - 1);
  }
  auto coords =
      types::adapt::eigen::gatherRows(structure.positions(), rows);
  return coords.colwise().mean().transpose();
}

double distance(const Eigen::Vector3d &a, const Eigen::Vector3d &b) {
  return (a - b).norm();
}

double distance(const Structure &structure, size_t i, size_t j) {
  return distance(structure.position(i), structure.position(j));
}

double angle(const Eigen::Vector3d &a, const Eigen::Vector3d &b,
             const Eigen::Vector3d &c) {
  Eigen::Vector3d v1 = a - b;
  Eigen::Vector3d v2 = c - b;
  double denom = v1.norm() * v2.norm();
  if (denom < kDegenerateTol) {
    throw Error(ErrorKind::DegenerateGeometry,
                "Angle arm of zero length (coincident atoms)");
  }
  return clampedAcosDeg(v1.dot(v2) / denom);
}

double angle(const Structure &structure, size_t i, size_t j, size_t k) {
  return angle(structure.position(i), structure.position(j),
               structure.position(k));
}

double dihedral(const Eigen::Vector3d &p0, const Eigen::Vector3d &p1,
                const Eigen::Vector3d &p2, const Eigen::Vector3d &p3) {
  Eigen::Vector3d b0 = p1 - p0;
  Eigen::Vector3d b1 = p2 - p1;
  Eigen::Vector3d b2 = p3 - p2;

  const char *msg = "Dihedral undefined: three consecutive atoms are collinear";
  Eigen::Vector3d n1 = normalized(b0.cross(b1), msg);
  Eigen::Vector3d n2 = normalized(b1.cross(b2), msg);

  double result = clampedAcosDeg(n1.dot(n2));
  if (b1.dot(n1.cross(n2)) < 0) {
    result = -result;
  }
  return result;
}

double dihedral(const Structure &structure, size_t i, size_t j, size_t k,
                size_t l) {
  return dihedral(structure.position(i), structure.position(j),
                  structure.position(k), structure.position(l));
}

} // namespace geom
} // namespace ringcom
