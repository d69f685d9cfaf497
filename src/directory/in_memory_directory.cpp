#include "pairlink/directory/in_memory_directory.hpp"

namespace pairlink::directory {

InMemoryDirectory::InMemoryDirectory(const interfaces::IClock& clock)
    : clock_(clock) {
}

void InMemoryDirectory::DropExpiredLocked(const interfaces::TimePoint now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at < now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

Result<Unit, PairingFailure> InMemoryDirectory::Put(
    std::span<const uint8_t> key,
    std::vector<uint8_t> value,
    const std::chrono::seconds ttl,
    std::chrono::milliseconds) {
    const auto now = clock_.Now();
    std::lock_guard guard(lock_);
    DropExpiredLocked(now);
    entries_[std::vector<uint8_t>(key.begin(), key.end())] = Entry{std::move(value), now + ttl};
    return Result<Unit, PairingFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, PairingFailure> InMemoryDirectory::Get(
    std::span<const uint8_t> key,
    std::chrono::milliseconds) {
    const auto now = clock_.Now();
    std::lock_guard guard(lock_);
    DropExpiredLocked(now);
    const auto it = entries_.find(std::vector<uint8_t>(key.begin(), key.end()));
    if (it == entries_.end()) {
        return Result<std::optional<std::vector<uint8_t>>, PairingFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::vector<uint8_t>>, PairingFailure>::Ok(it->second.value);
}

Result<Unit, PairingFailure> InMemoryDirectory::Remove(std::span<const uint8_t> key) {
    std::lock_guard guard(lock_);
    entries_.erase(std::vector<uint8_t>(key.begin(), key.end()));
    return Result<Unit, PairingFailure>::Ok(unit);
}

size_t InMemoryDirectory::Size() const {
    const auto now = clock_.Now();
    std::lock_guard guard(lock_);
    size_t live = 0;
    for (const auto& [key, entry] : entries_) {
        if (entry.expires_at >= now) {
            ++live;
        }
    }
    return live;
}

}
