#pragma once

#include <string>

namespace TS {

// Random RFC 4122 version 4 identifier, upper-case hex.
[[nodiscard]] auto freshId() -> std::string;

} // namespace TS
