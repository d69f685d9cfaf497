#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/constants.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include <unordered_map>
#include <vector>
#include <span>
#include <chrono>
#include <mutex>
#include <cstdint>
namespace pairlink::security {

/**
 * @brief Remembers handshake nonces to refuse replays
 *
 * A pairing request carries a fresh 16-byte nonce. Once a nonce has been
 * accepted, the same bytes are refused for `nonce_lifetime`, which is
 * longer than any session can live, so a captured request can never be
 * replayed against a later session. Entries older than the lifetime are
 * purged lazily every `cleanup_interval`.
 */
class NonceLedger {
public:
    NonceLedger();
    NonceLedger(
        std::chrono::minutes nonce_lifetime,
        std::chrono::minutes cleanup_interval);
    NonceLedger(const NonceLedger&) = delete;
    NonceLedger& operator=(const NonceLedger&) = delete;
    NonceLedger(NonceLedger&&) = delete;
    NonceLedger& operator=(NonceLedger&&) = delete;
    ~NonceLedger() = default;

    /// InvalidHandshake if `nonce` was already recorded or has the wrong size.
    Result<Unit, PairingFailure> CheckAndRecord(
        std::span<const uint8_t> nonce,
        interfaces::TimePoint now);

    [[nodiscard]] bool Contains(std::span<const uint8_t> nonce) const;

    void CleanupExpired(interfaces::TimePoint now);

    [[nodiscard]] size_t GetTrackedNonceCount() const;

    void Reset();
private:
    struct NonceHash {
        size_t operator()(const std::vector<uint8_t>& nonce) const;
    };

    void CleanupExpiredLocked(interfaces::TimePoint now);

    std::chrono::minutes nonce_lifetime_;
    std::chrono::minutes cleanup_interval_;
    mutable std::mutex lock_;
    std::unordered_map<std::vector<uint8_t>, interfaces::TimePoint, NonceHash> seen_nonces_;
    interfaces::TimePoint last_cleanup_{};
};
}
