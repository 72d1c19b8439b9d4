// diagnostics_json.hpp - JSON serialization for compile diagnostics
#pragma once
#include "automat/diagnostics.hpp"
#include "automat/env.hpp"
#include <optional>
#include <string>

namespace automat {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize one diagnostic to a compact JSON object.
std::string diagnostic_to_json(const Diagnostic& d);

// {"success":bool,"errors":[...]} for a whole compilation.
std::string result_to_json(bool success, const std::optional<Diagnostic>& error);

// When JSON diagnostics are enabled (AUTOMAT_DIAG_JSON=1 or --json), print the result JSON to stderr.
void maybe_print_json(const CompileEnv& env, bool success, const std::optional<Diagnostic>& error);

} // namespace automat
