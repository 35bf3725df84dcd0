#pragma once

namespace pyhazard {

inline constexpr const char *kToolVersion = "0.1.0";

} // namespace pyhazard
