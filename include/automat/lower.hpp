#pragma once
#include "automat/sast.hpp"

namespace automat::lower {

// for(init; cond; update) body  ==>  { init; while(cond) { body; update; } }
// Both blocks reuse the for statement's scope, so the update sees exactly
// the names the loop header saw.
sast::SStmtPtr desugar_for(const sast::SFor& f);

} // namespace automat::lower
