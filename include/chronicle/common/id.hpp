#pragma once

#include <cstddef>
#include <string>

namespace chronicle::common {

/// Random RFC 4122 version-4 UUID, e.g. "3f2b8c1e-9a4d-4f0e-8b6a-1c2d3e4f5a6b".
[[nodiscard]] std::string generate_id();

[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace chronicle::common
