#include "core/FilenameLocks.hpp"

namespace chunkdrop {
namespace core {

FilenameLocks::Guard::Guard(FilenameLocks& owner, const std::string& key)
    : owner_(owner), key_(key), entry_(nullptr) {
    {
        std::lock_guard<std::mutex> lock(owner_.registry_);
        auto& slot = owner_.entries_[key_];
        if (!slot) slot = std::make_unique<Entry>();
        ++slot->users;
        entry_ = slot.get();
    }
    entry_->mutex.lock();
}

FilenameLocks::Guard::~Guard() {
    entry_->mutex.unlock();

    std::lock_guard<std::mutex> lock(owner_.registry_);
    if (--entry_->users == 0) {
        owner_.entries_.erase(key_);
    }
}

std::size_t FilenameLocks::size() const {
    std::lock_guard<std::mutex> lock(registry_);
    return entries_.size();
}

} // namespace core
} // namespace chunkdrop
