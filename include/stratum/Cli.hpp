/**
 * @file Cli.hpp
 * @brief Command-line front end for template and instance documents
 *
 * Commands (operating on --template FILE, optionally --instance FILE):
 * - paths                      every reachable template path with its type
 * - get PATH                   effective value at PATH as JSON
 * - set PATH VALUE [--type T]  persistent write, instance file rewritten
 * - reset [PATH]               drop one override, or all of them
 * - overrides                  list overrides as path, type, payload
 * - dump [--to json|toml]      effective container as plain JSON/TOML
 * - diff OTHER                 overrides turning the template into OTHER
 */

#ifndef STRATUM_CLI_HPP
#define STRATUM_CLI_HPP

#include "stratum/Value.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace stratum {

/**
 * @brief Run the tool
 * @return Process exit code (0 success, 1 failure)
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

/**
 * @brief Turn command-line text into a value
 *
 * With a type id the text is decoded as that type's payload. Without
 * one the text is read as JSON: booleans, integers (int when they fit,
 * long otherwise), numbers (double) and strings; anything else is kept
 * as a string.
 */
Value parse_cli_value(const std::string& raw, const std::optional<std::string>& type_id);

} // namespace stratum

#endif // STRATUM_CLI_HPP
