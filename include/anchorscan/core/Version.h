#pragma once

namespace anchorscan {

inline constexpr const char *kToolVersion = "0.3.0";

} // namespace anchorscan
