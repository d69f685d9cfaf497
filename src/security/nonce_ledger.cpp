#include "pairlink/security/nonce_ledger.hpp"

namespace pairlink::security {
    namespace {
        constexpr size_t kFnvOffsetBasis = 14695981039346656037ULL;
        constexpr size_t kFnvPrime = 1099511628211ULL;
        constexpr std::chrono::minutes kDefaultCleanupInterval{1};
    }

    size_t NonceLedger::NonceHash::operator()(const std::vector<uint8_t> &nonce) const {
        size_t hash = kFnvOffsetBasis;
        for (const uint8_t byte: nonce) {
            hash ^= static_cast<size_t>(byte);
            hash *= kFnvPrime;
        }
        return hash;
    }

    NonceLedger::NonceLedger()
        : NonceLedger(PairingDefaults::REPLAY_NONCE_LIFETIME, kDefaultCleanupInterval) {
    }

    NonceLedger::NonceLedger(
        const std::chrono::minutes nonce_lifetime,
        const std::chrono::minutes cleanup_interval)
        : nonce_lifetime_(nonce_lifetime)
          , cleanup_interval_(cleanup_interval) {
    }

    Result<Unit, PairingFailure> NonceLedger::CheckAndRecord(
        std::span<const uint8_t> nonce,
        const interfaces::TimePoint now) {
        if (nonce.size() != kHandshakeNonceBytes) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidHandshake("Handshake nonce has wrong size"));
        }
        std::lock_guard guard(lock_);
        if (now - last_cleanup_ >= cleanup_interval_) {
            last_cleanup_ = now;
            CleanupExpiredLocked(now);
        }
        std::vector<uint8_t> key(nonce.begin(), nonce.end());
        if (seen_nonces_.contains(key)) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidHandshake("Replay detected: nonce already processed"));
        }
        seen_nonces_.emplace(std::move(key), now);
        return Result<Unit, PairingFailure>::Ok(unit);
    }

    bool NonceLedger::Contains(std::span<const uint8_t> nonce) const {
        std::lock_guard guard(lock_);
        return seen_nonces_.contains(std::vector<uint8_t>(nonce.begin(), nonce.end()));
    }

    void NonceLedger::CleanupExpired(const interfaces::TimePoint now) {
        std::lock_guard guard(lock_);
        last_cleanup_ = now;
        CleanupExpiredLocked(now);
    }

    void NonceLedger::CleanupExpiredLocked(const interfaces::TimePoint now) {
        for (auto it = seen_nonces_.begin(); it != seen_nonces_.end();) {
            if (now - it->second > nonce_lifetime_) {
                it = seen_nonces_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t NonceLedger::GetTrackedNonceCount() const {
        std::lock_guard guard(lock_);
        return seen_nonces_.size();
    }

    void NonceLedger::Reset() {
        std::lock_guard guard(lock_);
        seen_nonces_.clear();
        last_cleanup_ = {};
    }
}
