// MIT License
// Copyright 2023--present ringcom developers
#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "ringcom/XyzIO.hpp"
#include "ringcom/errors.hpp"

using namespace Catch::Matchers;
namespace fs = std::filesystem;

namespace {

ringcom::ErrorKind kindOf(const std::string &text) {
  std::istringstream in(text);
  try {
    ringcom::io::readXyz(in);
  } catch (const ringcom::Error &e) {
    return e.kind();
  }
  FAIL("expected a ringcom::Error");
  return ringcom::ErrorKind::InvalidArgument;
}

} // namespace

TEST_CASE("Reading xyz documents", "[io]") {
  SECTION("Well formed input") {
    std::istringstream in("3\nwater plus iron\n"
                          "O 0.0 0.0 0.1173\n"
                          "H   0.0  0.7572 -0.4692 extra\n"
                          "Fe 1e-1 -2.5 3\n"
                          "this line is past the declared atoms\n");
    auto s = ringcom::io::readXyz(in);
    REQUIRE(s.size() == 3);
    REQUIRE(s.symbol(1) == "O");
    REQUIRE(s.symbol(3) == "Fe");
    REQUIRE_THAT(s.position(2).y(), WithinAbs(0.7572, 1e-12));
    REQUIRE_THAT(s.position(3).x(), WithinAbs(0.1, 1e-12));
  }

  SECTION("Malformed input") {
    using ringcom::ErrorKind;
    REQUIRE(kindOf("") == ErrorKind::MalformedStructure);
    REQUIRE(kindOf("three\ncomment\n") == ErrorKind::MalformedStructure);
    REQUIRE(kindOf("2\n") == ErrorKind::MalformedStructure);
    REQUIRE(kindOf("2\ncomment\nC 0 0 0\n") == ErrorKind::MalformedStructure);
    REQUIRE(kindOf("1\ncomment\nC 0 0\n") == ErrorKind::MalformedStructure);
    REQUIRE(kindOf("1\ncomment\nC 0 zero 0\n") ==
            ErrorKind::MalformedStructure);
    REQUIRE(kindOf("1\ncomment\nC 0 1.0x 0\n") ==
            ErrorKind::MalformedStructure);
  }

  SECTION("Huge declared count with one atom line") {
    REQUIRE(kindOf("99999999999999\ncomment\nC 0 0 0\n") ==
            ringcom::ErrorKind::MalformedStructure);
  }

  SECTION("Missing file") {
    try {
      ringcom::io::readXyz(std::string("/nonexistent/ringcom/none.xyz"));
      FAIL("expected FileNotFound");
    } catch (const ringcom::Error &e) {
      REQUIRE(e.kind() == ringcom::ErrorKind::FileNotFound);
    }
  }
}

TEST_CASE("Writing xyz documents", "[io]") {
  ringcom::Structure s;
  s.addAtom("C", Eigen::Vector3d(1.23456789, -0.5, 0.0));
  s.addAtom("X", Eigen::Vector3d(0.0, 0.0, 1.65));

  SECTION("Six decimal layout") {
    std::ostringstream out;
    ringcom::io::writeXyz(out, s);
    REQUIRE(out.str() == "2\nGenerated by ringcom\n"
                         "C 1.234568 -0.500000 0.000000\n"
                         "X 0.000000 0.000000 1.650000\n");
  }

  SECTION("File round trip keeps order and coordinates") {
    fs::path path = fs::temp_directory_path() / "ringcom_io_roundtrip.xyz";
    fs::remove(path);
    ringcom::io::writeXyz(path.string(), s, "custom comment");

    auto back = ringcom::io::readXyz(path.string());
    REQUIRE(back.size() == s.size());
    for (size_t i = 1; i <= s.size(); ++i) {
      REQUIRE(back.symbol(i) == s.symbol(i));
      REQUIRE((back.position(i) - s.position(i)).cwiseAbs().maxCoeff() <=
              5e-7);
    }

    std::ifstream raw(path);
    std::string first, second;
    std::getline(raw, first);
    std::getline(raw, second);
    REQUIRE(first == "2");
    REQUIRE(second == "custom comment");
    fs::remove(path);
  }
}
