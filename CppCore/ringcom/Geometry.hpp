#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Stateless geometry kernel.
 *
 * Centroid, distance, angle and dihedral calculations. Each calculation is
 * offered on raw points and on one-based atom indices of a @c Structure;
 * the index forms look up positions through the structure's read-only view.
 * Angles are returned in degrees.
 */

#include <Eigen/Dense>

#include "ringcom/Structure.hpp"
#include "ringcom/ring_types.hpp"

namespace ringcom {
namespace geom {

/// Norms below this are treated as zero (coincident or collinear points).
constexpr double kDegenerateTol = 1e-10;

/**
 * @brief Arithmetic mean of the ring atom positions.
 * @param structure Source of positions.
 * @param ring      One-based atom indices, in any order.
 * @return The centroid.
 * @throws ringcom::Error IndexOutOfRange if any index is invalid.
 */
Eigen::Vector3d centroid(const Structure &structure, const Ring &ring);

double distance(const Eigen::Vector3d &a, const Eigen::Vector3d &b);

/**
 * @brief Euclidean distance between two atoms.
 * @param structure Source of positions.
 * @param i One-based index of the first atom.
 * @param j One-based index of the second atom.
 * @return Distance in Å.
 */
double distance(const Structure &structure, size_t i, size_t j);

/**
 * @brief Angle at vertex @a b between the arms towards @a a and @a c.
 *
 * The cosine is clamped to [-1, 1] before @c acos so near-collinear input
 * cannot leave the domain.
 *
 * @return Angle in degrees, within [0, 180].
 * @throws ringcom::Error DegenerateGeometry if an arm has zero length.
 */
double angle(const Eigen::Vector3d &a, const Eigen::Vector3d &b,
             const Eigen::Vector3d &c);

double angle(const Structure &structure, size_t i, size_t j, size_t k);

/**
 * @brief Signed dihedral angle of four sequential points.
 *
 * With bond vectors b0 = p1 - p0, b1 = p2 - p1, b2 = p3 - p2 the plane
 * normals n1 = b0 x b1 and n2 = b1 x b2 are normalised; the magnitude is
 * acos(clamp(n1 . n2)) and the sign is negative when b1 . (n1 x n2) < 0.
 *
 * @return Angle in degrees, within (-180, 180].
 * @throws ringcom::Error DegenerateGeometry if three consecutive points are
 *         collinear.
 */
double dihedral(const Eigen::Vector3d &p0, const Eigen::Vector3d &p1,
                const Eigen::Vector3d &p2, const Eigen::Vector3d &p3);

double dihedral(const Structure &structure, size_t i, size_t j, size_t k,
                size_t l);

} // namespace geom
} // namespace ringcom
