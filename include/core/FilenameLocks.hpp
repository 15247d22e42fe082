#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkdrop {
namespace core {

/**
 * One mutex per key, created on first use and dropped when the last holder
 * or waiter releases it.
 */
class FilenameLocks {
    struct Entry {
        std::mutex mutex;
        std::size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(FilenameLocks& owner, const std::string& key);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        FilenameLocks& owner_;
        std::string key_;
        Entry* entry_;
    };

    Guard lock(const std::string& key) { return Guard(*this, key); }

    // Keys currently held or waited on
    std::size_t size() const;

private:
    mutable std::mutex registry_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace core
} // namespace chunkdrop
