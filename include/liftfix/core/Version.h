#pragma once

namespace liftfix {

inline constexpr const char *kToolVersion = "0.1.0";

} // namespace liftfix
