#pragma once

#include "secret_finding.hpp"
#include <string_view>

namespace leakscan {

// Best-effort tiering for tools that report no severity of their own.
// Case-insensitive substring checks on the detector and rule names (a family
// matches if either name contains it), first match wins:
//   verified + private key or major cloud credential      CRITICAL
//   verified + anything else                              HIGH
//   unverified + private key or personal access token     CRITICAL
//   unverified + named cloud/service credential           HIGH
//   unverified + generic password/token/secret, "example" in neither name  MEDIUM
//   otherwise                                             LOW
Severity classify_severity(std::string_view detector_name, std::string_view rule_name, Verification verification);

} // namespace leakscan
