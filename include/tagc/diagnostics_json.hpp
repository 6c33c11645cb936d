// diagnostics_json.hpp - machine and human readable renderings of a TypeCheckResult
#pragma once
#include "tagc/type_check.hpp"
#include <string>

namespace tagc {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const TypeCheckResult& r);

// One block per diagnostic: "<file>:<line>:<col>: error[E2001]: message", then notes and hint.
std::string format_diagnostics(const TypeCheckResult& r, const std::string& file="<input>");

// If TAGC_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const TypeCheckResult& r);

} // namespace tagc
