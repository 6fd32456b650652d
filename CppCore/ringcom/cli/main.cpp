// MIT License
// Copyright 2023--present ringcom developers
#include <iostream>

#include <fmt/core.h>

#include "ringcom/cli/Options.hpp"
#include "ringcom/cli/Run.hpp"
#include "ringcom/errors.hpp"

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "ringcom_analyze";

  ringcom::cli::Options opts;
  try {
    opts = ringcom::cli::parseArgs(argc, argv);
  } catch (const ringcom::Error &e) {
    fmt::print(stderr, "Error: {}\n\n{}", e.what(),
               ringcom::cli::usage(program));
    return 1;
  }
  if (opts.help) {
    fmt::print("{}", ringcom::cli::usage(program));
    return 0;
  }
  return ringcom::cli::run(opts, std::cout, std::cerr);
}
