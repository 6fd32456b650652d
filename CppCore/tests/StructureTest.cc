// MIT License
// Copyright 2023--present ringcom developers
#include <catch2/catch_all.hpp>

#include "ringcom/Structure.hpp"
#include "ringcom/errors.hpp"
#include "ringcom/types/AtomMatrix.hpp"
#include "ringcom/types/adapters/eigen.hpp"

using namespace Catch::Matchers;

TEST_CASE("AtomMatrix grows by rows", "[types]") {
  ringcom::types::AtomMatrix m{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};
  REQUIRE(m.rows() == 2);
  REQUIRE(m.cols() == 3);

  REQUIRE(m.appendRow({7.0, 8.0, 9.0}) == 2);
  REQUIRE(m.rows() == 3);
  REQUIRE(m.size() == 9);
  REQUIRE(m(0, 0) == 1.0);
  REQUIRE(m(2, 2) == 9.0);

  REQUIRE_THROWS_AS(m.appendRow({1.0, 2.0}), std::invalid_argument);
  REQUIRE(m.rows() == 3);
}

TEST_CASE("Eigen adapter round trips rows", "[types][adapter]") {
  namespace ad = ringcom::types::adapt::eigen;
  ringcom::types::AtomMatrix m(3);
  REQUIRE(ad::appendVector3d(m, Eigen::Vector3d(1.5, -2.0, 0.25)) == 0);
  REQUIRE(ad::appendVector3d(m, Eigen::Vector3d(0.0, 1.0, 2.0)) == 1);

  Eigen::Vector3d r = ad::rowToVector3d(m, 0);
  REQUIRE(r.x() == Catch::Approx(1.5));
  REQUIRE(r.y() == Catch::Approx(-2.0));
  REQUIRE(r.z() == Catch::Approx(0.25));

  auto gathered = ad::gatherRows(m, {1, 0});
  REQUIRE(gathered.rows() == 2);
  REQUIRE(gathered(0, 2) == Catch::Approx(2.0));
  REQUIRE(gathered(1, 0) == Catch::Approx(1.5));
}

TEST_CASE("Structure is append only and one-based", "[structure]") {
  ringcom::Structure s;
  REQUIRE(s.empty());

  REQUIRE(s.addAtom("C", Eigen::Vector3d(0.0, 0.0, 0.0)) == 1);
  REQUIRE(s.addAtom("Fe", Eigen::Vector3d(1.0, 2.0, 3.0)) == 2);
  REQUIRE(s.size() == 2);
  REQUIRE(s.positions().rows() == s.symbols().size());

  REQUIRE(s.symbol(2) == "Fe");
  REQUIRE(s.label(2) == "Fe2");
  REQUIRE(s.position(2).isApprox(Eigen::Vector3d(1.0, 2.0, 3.0)));

  SECTION("Indices outside [1, N] are rejected") {
    for (size_t bad : {size_t{0}, size_t{3}}) {
      try {
        (void)s.position(bad);
        FAIL("expected IndexOutOfRange");
      } catch (const ringcom::Error &e) {
        REQUIRE(e.kind() == ringcom::ErrorKind::IndexOutOfRange);
      }
    }
    REQUIRE_THROWS_AS(s.symbol(0), ringcom::Error);
  }
}
