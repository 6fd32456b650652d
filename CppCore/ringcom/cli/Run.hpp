#pragma once
// MIT License
// Copyright 2023--present ringcom developers

/**
 * @brief One complete ringcom_analyze run, from parsed options to exit code.
 */

#include <iosfwd>

#include "ringcom/cli/Options.hpp"

namespace ringcom {
namespace cli {

/**
 * @brief Reads, analyzes, reports and writes, as the program does.
 *
 * Any @c ringcom::Error is reported as "Error: <message>" on @a err and
 * nothing is written to the output path.
 *
 * @param opts Parsed command line (help is not handled here).
 * @param out  Destination of progress and result lines.
 * @param err  Destination of error lines.
 * @return 0 on success, 1 on failure.
 */
int run(const Options &opts, std::ostream &out, std::ostream &err);

} // namespace cli
} // namespace ringcom
