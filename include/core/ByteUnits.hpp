#pragma once

#include <cstdint>
#include <string>

namespace chunkdrop {
namespace core {

// Human friendly size: "512 Bytes", "1 Byte", "1.50 KB", "3.00 GB"
std::string formatBytes(std::uint64_t bytes);

} // namespace core
} // namespace chunkdrop
