#pragma once

#include <filesystem>
#include <string>

namespace chunkdrop {
namespace core {

/**
 * Absolute destination path derived from a client-supplied filename,
 * guaranteed to resolve inside the upload root.
 */
class UploadTarget {
public:
    /**
     * Validate filename and place it in directory.
     * @param root Upload root every target must stay under
     * @param directory Directory the file goes to (root or below)
     * @param filename Bare filename, see sanitizeFilename()
     * @throws UploadError ValidationError when the result leaves root
     */
    static UploadTarget resolve(const std::filesystem::path& root,
                                const std::filesystem::path& directory,
                                const std::string& filename);

    /**
     * Map a decoded request path onto a directory under root.
     * Empty and "." segments are dropped, ".." removes the segment before it and
     * stops at root, so the result never leaves root.
     */
    static std::filesystem::path translatePath(const std::filesystem::path& root,
                                               const std::string& urlPath);

    // Rejects empty names, "." and "..", separators and NUL bytes.
    static std::string sanitizeFilename(const std::string& name);

    // Last component of a browser-supplied name ("C:\\dir\\a.txt" -> "a.txt").
    static std::string baseName(const std::string& clientName);

    // Lexical containment after weakly_canonical() on both sides.
    static bool isWithin(const std::filesystem::path& path, const std::filesystem::path& dir);

    const std::filesystem::path& path() const { return path_; }
    const std::string& filename() const { return filename_; }

private:
    UploadTarget(std::filesystem::path path, std::string filename)
        : path_(std::move(path)), filename_(std::move(filename)) {}

    std::filesystem::path path_;
    std::string filename_;
};

} // namespace core
} // namespace chunkdrop
