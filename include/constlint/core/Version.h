#pragma once

namespace constlint {

inline constexpr const char *kToolName    = "constlint";
inline constexpr const char *kToolVersion = "0.3.0";

} // namespace constlint
