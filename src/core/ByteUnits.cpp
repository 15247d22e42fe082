#include "core/ByteUnits.hpp"

#include <iomanip>
#include <sstream>

namespace chunkdrop {
namespace core {

std::string formatBytes(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    if (bytes < 1024) {
        return std::to_string(bytes) + (bytes == 1 ? " Byte" : " Bytes");
    }

    const double b = static_cast<double>(bytes);
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (b < MB) ss << b / KB << " KB";
    else if (b < GB) ss << b / MB << " MB";
    else if (b < TB) ss << b / GB << " GB";
    else ss << b / TB << " TB";
    return ss.str();
}

} // namespace core
} // namespace chunkdrop
