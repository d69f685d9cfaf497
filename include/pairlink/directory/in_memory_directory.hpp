#pragma once
#include "pairlink/interfaces/i_clock.hpp"
#include "pairlink/interfaces/i_key_value_directory.hpp"

#include <map>
#include <mutex>
#include <vector>

namespace pairlink::directory {

/// Process-local key/value directory with ttl expiry. Stands in for the
/// DHT when both devices share a process (tests, demos) and serves as the
/// reference behaviour for real adapters. Thread-safe.
class InMemoryDirectory final : public interfaces::IKeyValueDirectory {
public:
    explicit InMemoryDirectory(const interfaces::IClock& clock);

    Result<Unit, PairingFailure> Put(
        std::span<const uint8_t> key,
        std::vector<uint8_t> value,
        std::chrono::seconds ttl,
        std::chrono::milliseconds timeout) override;

    Result<std::optional<std::vector<uint8_t>>, PairingFailure> Get(
        std::span<const uint8_t> key,
        std::chrono::milliseconds timeout) override;

    Result<Unit, PairingFailure> Remove(std::span<const uint8_t> key) override;

    /// Live entries only.
    [[nodiscard]] size_t Size() const;

private:
    struct Entry {
        std::vector<uint8_t> value;
        interfaces::TimePoint expires_at;
    };

    void DropExpiredLocked(interfaces::TimePoint now);

    const interfaces::IClock& clock_;
    mutable std::mutex lock_;
    std::map<std::vector<uint8_t>, Entry> entries_;
};

}
