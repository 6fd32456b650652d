// MIT License
// Copyright 2023--present ringcom developers
#include <catch2/catch_all.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include "SandwichFixtures.hpp"
#include "ringcom/Geometry.hpp"
#include "ringcom/errors.hpp"

using namespace Catch::Matchers;
using Eigen::Vector3d;
using ringcom::geom::angle;
using ringcom::geom::centroid;
using ringcom::geom::dihedral;
using ringcom::geom::distance;

namespace {

ringcom::Structure randomStructure(size_t n, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<> dis(-5.0, 5.0);
  ringcom::Structure s;
  for (size_t i = 0; i < n; ++i) {
    s.addAtom("C", Vector3d(dis(gen), dis(gen), dis(gen)));
  }
  return s;
}

} // namespace

TEST_CASE("Centroid of a ring", "[geometry][centroid]") {
  fixtures::Metallocene mol;

  SECTION("Regular ring is centred on its axis") {
    Vector3d c = centroid(mol.structure, mol.ring1);
    REQUIRE_THAT(c.x(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(c.y(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(c.z(), WithinAbs(1.65, 1e-12));
  }

  SECTION("Order of the indices does not matter") {
    auto s = randomStructure(6, 1644009449);
    ringcom::Ring ring{1, 2, 3, 4, 5, 6};
    Vector3d ref = centroid(s, ring);
    int checked = 0;
    while (std::next_permutation(ring.begin(), ring.end()) && checked < 50) {
      Vector3d c = centroid(s, ring);
      REQUIRE((c - ref).norm() < 1e-12);
      ++checked;
    }
  }

  SECTION("Out of range index is rejected") {
    ringcom::Ring bad{1, 2, 3, 4, 99};
    try {
      centroid(mol.structure, bad);
      FAIL("expected IndexOutOfRange");
    } catch (const ringcom::Error &e) {
      REQUIRE(e.kind() == ringcom::ErrorKind::IndexOutOfRange);
    }
    ringcom::Ring zero{0, 1, 2, 3, 4};
    REQUIRE_THROWS_AS(centroid(mol.structure, zero), ringcom::Error);
  }
}

TEST_CASE("Distance is a metric", "[geometry][distance]") {
  auto s = randomStructure(8, 42);
  for (size_t i = 1; i <= s.size(); ++i) {
    REQUIRE(distance(s, i, i) == 0.0);
    for (size_t j = 1; j <= s.size(); ++j) {
      REQUIRE(distance(s, i, j) == distance(s, j, i));
    }
  }
  REQUIRE_THAT(distance(Vector3d(0, 0, 0), Vector3d(3, 4, 0)),
               WithinAbs(5.0, 1e-12));
}

TEST_CASE("Angle stays within [0, 180]", "[geometry][angle]") {
  SECTION("Right angle") {
    REQUIRE_THAT(angle(Vector3d(1, 0, 0), Vector3d(0, 0, 0), Vector3d(0, 1, 0)),
                 WithinAbs(90.0, 1e-12));
  }

  SECTION("Near collinear input is clamped") {
    double straight =
        angle(Vector3d(0, 0, 0), Vector3d(1, 0, 0), Vector3d(2, 1e-13, 0));
    REQUIRE_FALSE(std::isnan(straight));
    REQUIRE_THAT(straight, WithinAbs(180.0, 1e-6));

    double folded =
        angle(Vector3d(2, 1e-13, 0), Vector3d(0, 0, 0), Vector3d(1, 0, 0));
    REQUIRE_FALSE(std::isnan(folded));
    REQUIRE_THAT(folded, WithinAbs(0.0, 1e-4));
  }

  SECTION("Random triples") {
    auto s = randomStructure(10, 7);
    for (size_t i = 1; i <= 8; ++i) {
      double a = angle(s, i, i + 1, i + 2);
      REQUIRE(a >= 0.0);
      REQUIRE(a <= 180.0);
    }
  }

  SECTION("Coincident vertex is degenerate") {
    try {
      angle(Vector3d(1, 0, 0), Vector3d(1, 0, 0), Vector3d(0, 1, 0));
      FAIL("expected DegenerateGeometry");
    } catch (const ringcom::Error &e) {
      REQUIRE(e.kind() == ringcom::ErrorKind::DegenerateGeometry);
    }
  }
}

TEST_CASE("Signed dihedral", "[geometry][dihedral]") {
  const Vector3d p0(1, 0, 0), p1(0, 0, 0), p2(0, 1, 0), p3(0, 1, 1);

  SECTION("Known value and its mirror image") {
    REQUIRE_THAT(dihedral(p0, p1, p2, p3), WithinAbs(-90.0, 1e-12));
    // Reflection through z = 0 flips the handedness.
    REQUIRE_THAT(dihedral(p0, p1, p2, Vector3d(0, 1, -1)),
                 WithinAbs(90.0, 1e-12));
  }

  SECTION("Reversing the atom order keeps the value") {
    auto s = randomStructure(12, 2024);
    for (size_t i = 1; i + 3 <= s.size(); ++i) {
      double fwd = dihedral(s, i, i + 1, i + 2, i + 3);
      double rev = dihedral(s, i + 3, i + 2, i + 1, i);
      REQUIRE_THAT(fwd, WithinAbs(rev, 1e-9));
      REQUIRE(fwd > -180.0);
      REQUIRE(fwd <= 180.0);
    }
  }

  SECTION("Mirror image negates random dihedrals") {
    auto s = randomStructure(4, 99);
    Vector3d q[4];
    for (size_t i = 0; i < 4; ++i) {
      q[i] = s.position(i + 1);
      q[i].z() = -q[i].z();
    }
    REQUIRE_THAT(dihedral(s, 1, 2, 3, 4),
                 WithinAbs(-dihedral(q[0], q[1], q[2], q[3]), 1e-9));
  }

  SECTION("Coplanar points give 0 or 180") {
    Vector3d a(0, 1, 0), b(0, 0, 0), c(1, 0, 0);
    REQUIRE_THAT(dihedral(a, b, c, Vector3d(1, 1, 0)), WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(std::abs(dihedral(a, b, c, Vector3d(1, -1, 0))),
                 WithinAbs(180.0, 1e-6));
  }

  SECTION("Collinear triple is degenerate") {
    try {
      dihedral(Vector3d(0, 0, 0), Vector3d(1, 0, 0), Vector3d(2, 0, 0),
               Vector3d(2, 1, 0));
      FAIL("expected DegenerateGeometry");
    } catch (const ringcom::Error &e) {
      REQUIRE(e.kind() == ringcom::ErrorKind::DegenerateGeometry);
    }
  }
}
