#include "core/UploadTarget.hpp"
#include "core/UploadError.hpp"

#include <system_error>
#include <vector>

namespace chunkdrop {
namespace core {

namespace fs = std::filesystem;

namespace {
    // Leaves room for the ".chunk_NNNN" suffix under NAME_MAX
    constexpr std::size_t kMaxFilenameLength = 240;
}

std::string UploadTarget::sanitizeFilename(const std::string& name) {
    if (name.empty()) {
        throw UploadError(ErrorKind::Validation, "filename is empty");
    }
    if (name == "." || name == "..") {
        throw UploadError(ErrorKind::Validation, "filename '" + name + "' is not allowed");
    }
    if (name.size() > kMaxFilenameLength) {
        throw UploadError(ErrorKind::Validation,
                          "filename longer than " + std::to_string(kMaxFilenameLength) + " bytes");
    }
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            throw UploadError(ErrorKind::Validation,
                              "filename must not contain path separators: '" + name + "'");
        }
    }
    return name;
}

std::string UploadTarget::baseName(const std::string& clientName) {
    auto slash = clientName.find_last_of("/\\");
    if (slash == std::string::npos) return clientName;
    return clientName.substr(slash + 1);
}

fs::path UploadTarget::translatePath(const fs::path& root, const std::string& urlPath) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= urlPath.size()) {
        size_t next = urlPath.find_first_of("/\\", pos);
        if (next == std::string::npos) next = urlPath.size();
        std::string word = urlPath.substr(pos, next - pos);
        pos = next + 1;

        if (word.empty() || word == ".") continue;
        if (word == "..") {
            if (!segments.empty()) segments.pop_back();
            continue;
        }
        if (word.find('\0') != std::string::npos) continue;
        segments.push_back(word);
    }

    fs::path result = root;
    for (const auto& word : segments) {
        result /= word;
    }
    return result;
}

bool UploadTarget::isWithin(const fs::path& path, const fs::path& dir) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(path, ec);
    if (ec) return false;
    fs::path d = fs::weakly_canonical(dir, ec);
    if (ec) return false;

    fs::path rel = p.lexically_relative(d);
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

UploadTarget UploadTarget::resolve(const fs::path& root,
                                   const fs::path& directory,
                                   const std::string& filename) {
    std::string name = sanitizeFilename(filename);
    fs::path candidate = directory / name;

    std::error_code ec;
    fs::path absolute = fs::weakly_canonical(candidate, ec);
    if (ec) {
        throw UploadError(ErrorKind::Storage,
                          "cannot resolve " + candidate.string() + " (" + ec.message() + ")");
    }
    if (!isWithin(absolute, root) || absolute == fs::weakly_canonical(root, ec)) {
        throw UploadError(ErrorKind::Validation,
                          "path '" + candidate.string() + "' escapes the upload root");
    }
    return UploadTarget(absolute, name);
}

} // namespace core
} // namespace chunkdrop
