// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief Implementation of the command line parser.
 */

// clang-format off
#include <charconv>
#include <filesystem>
#include <system_error>
// clang-format on
#include <fmt/core.h>

#include "ringcom/cli/Options.hpp"
#include "ringcom/errors.hpp"

namespace ringcom {
namespace cli {

namespace {

Error invalid(const std::string &msg) {
  return Error(ErrorKind::InvalidArgument, msg);
}

bool isFlag(const std::string &arg) {
  return arg.size() > 1 && arg[0] == '-';
}

size_t parseIndex(const std::string &flag, const std::string &text) {
  size_t value = 0;
  const char *first = text.data();
  const char *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || text.empty()) {
    throw invalid(
        fmt::format("{} expects atom numbers, got '{}'", flag, text));
  }
  return value;
}

} // namespace

std::string Options::outputPath() const {
  return output.empty() ? defaultOutputPath(input) : output;
}

RingInput Options::ringInput() const {
  RingInput rin;
  rin.ring1 = ring1;
  rin.ring2 = ring2;
  rin.ring3 = ring3;
  rin.metal1 = metal1.value_or(0);
  rin.metal2 = metal2;
  return rin;
}

/**
 * @details
 * Ring flags consume every following argument up to the next flag, so
 * "--ring1 1 2 3 4 5" yields five indices. A ring flag with no values is an
 * error; repeating a flag replaces the earlier value.
 */
Options parseArgs(int argc, const char *const argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  Options opts;
  bool have_ring1 = false;
  bool have_ring2 = false;

  size_t i = 0;
  auto single = [&](const std::string &flag) -> const std::string & {
    if (i + 1 >= args.size() || isFlag(args[i + 1])) {
      throw invalid(fmt::format("{} expects a value", flag));
    }
    return args[++i];
  };
  auto list = [&](const std::string &flag) {
    Ring ring;
    while (i + 1 < args.size() && !isFlag(args[i + 1])) {
      ring.push_back(parseIndex(flag, args[++i]));
    }
    if (ring.empty()) {
      throw invalid(fmt::format("{} expects at least one atom number", flag));
    }
    return ring;
  };

  for (; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "-h" || arg == "--help") {
      opts.help = true;
      return opts;
    } else if (arg == "--ring1") {
      opts.ring1 = list(arg);
      have_ring1 = true;
    } else if (arg == "--ring2") {
      opts.ring2 = list(arg);
      have_ring2 = true;
    } else if (arg == "--ring3") {
      opts.ring3 = list(arg);
    } else if (arg == "--metal1") {
      opts.metal1 = parseIndex(arg, single(arg));
    } else if (arg == "--metal2") {
      opts.metal2 = parseIndex(arg, single(arg));
    } else if (arg == "--output") {
      opts.output = single(arg);
    } else if (arg == "-q" || arg == "--quiet") {
      opts.quiet = true;
    } else if (isFlag(arg)) {
      throw invalid(fmt::format("Unknown option '{}'", arg));
    } else if (opts.input.empty()) {
      opts.input = arg;
    } else {
      throw invalid(fmt::format("Unexpected argument '{}'", arg));
    }
  }

  if (opts.input.empty()) {
    throw invalid("Missing input xyz file");
  }
  if (!have_ring1 || !have_ring2) {
    throw invalid("--ring1 and --ring2 are required");
  }
  if (!opts.metal1) {
    throw invalid("--metal1 is required");
  }
  return opts;
}

std::string defaultOutputPath(const std::string &input) {
  namespace fs = std::filesystem;
  fs::path path(input);
  std::string name = path.stem().string() + "_analyzed" +
                     path.extension().string();
  return (path.parent_path() / name).string();
}

std::string usage(const std::string &program) {
  return fmt::format(
      R"(Usage: {0} <xyz_file> --ring1 I... --ring2 I... [--ring3 I...]
       --metal1 M [--metal2 M] [--output FILE] [--quiet]

Metallocene and inverse sandwich analyzer: adds dummy atoms (X) at ring
centroids and reports metal-centroid distances and angles. With three rings
it also reports the middle ring bond distances, dihedral angles and the
metal-metal distance.

Options:
  --ring1 I...   Atom numbers of the first ring (5 or 6 atoms)
  --ring2 I...   Atom numbers of the second ring (5 or 6 atoms)
  --ring3 I...   Atom numbers of the third ring (optional, 5 or 6 atoms)
  --metal1 M     Atom number of the first metal
  --metal2 M     Atom number of the second metal (required with 3 rings)
  --output FILE  Output xyz file (default: input name with '_analyzed')
  -q, --quiet    Do not print progress and results
  -h, --help     Show this help

Examples:
  {0} ferrocene.xyz --ring1 1 2 3 4 5 --ring2 6 7 8 9 10 --metal1 11
  {0} inverse_sandwich.xyz --ring1 1 2 3 4 5 --ring2 6 7 8 9 10 \
      --ring3 11 12 13 14 15 --metal1 16 --metal2 17

Notes:
  Atom numbers are 1-based.
  With 3 rings, metal1 is reassigned to the metal closer to ring1 and metal2
  to the metal closer to ring3.
  With 3 rings, list the middle ring (ring2) in the order its atoms are
  bonded around the ring (e.g. C1 C2 C3 C4 C5 C6); bond distances and
  dihedral angles depend on it.
)",
      program);
}

} // namespace cli
} // namespace ringcom
