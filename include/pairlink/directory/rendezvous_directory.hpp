#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/directory/rendezvous_record.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include "pairlink/interfaces/i_key_value_directory.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace pairlink::directory {

/**
 * @brief Publishes and resolves rendezvous records in the key/value directory
 *
 * Records live under KeyFor(prefix) = SHA-256("/pairlink/share-code/" ||
 * big-endian prefix) and are serialized as the RendezvousRecord protobuf.
 *
 * Every call carries a timeout. It is handed to the underlying store and
 * checked again when the store returns: an answer that arrives after the
 * deadline is treated as DirectoryUnavailable, whatever it says.
 *
 * Stateless apart from its two references; safe to use from executor
 * threads as long as the store and the clock are.
 */
class RendezvousDirectory {
public:
    RendezvousDirectory(interfaces::IKeyValueDirectory& store, const interfaces::IClock& clock);

    [[nodiscard]] static DirectoryKey KeyFor(uint32_t token_prefix);

    [[nodiscard]] static Result<std::vector<uint8_t>, PairingFailure> EncodeRecord(const RendezvousRecord& record);

    [[nodiscard]] static Result<RendezvousRecord, PairingFailure> DecodeRecord(std::span<const uint8_t> bytes);

    /**
     * @brief Store `record` under `key` for `ttl`
     *
     * Looks the key up first: a live record from a different publisher
     * fails the call with DuplicateToken and leaves it untouched.
     * Re-publishing one's own record is idempotent.
     */
    [[nodiscard]] Result<Unit, PairingFailure> Publish(
        const DirectoryKey& key,
        const RendezvousRecord& record,
        std::chrono::seconds ttl,
        std::chrono::milliseconds timeout);

    /**
     * @brief Single best-effort lookup
     *
     * NotFound covers absence, undecodable values, a hash that does not
     * match the key, a publisher identifier that does not match its key
     * and an elapsed ttl.
     */
    [[nodiscard]] Result<RendezvousRecord, PairingFailure> Resolve(
        const DirectoryKey& key,
        std::chrono::milliseconds timeout);

    /// Best-effort removal. Failures are logged and otherwise ignored; the
    /// record's ttl cleans up regardless.
    void Unpublish(const DirectoryKey& key);

private:
    [[nodiscard]] bool DeadlinePassed(interfaces::TimePoint started, std::chrono::milliseconds timeout) const;

    [[nodiscard]] Result<RendezvousRecord, PairingFailure> ValidateRecord(
        const DirectoryKey& key,
        std::span<const uint8_t> bytes) const;

    interfaces::IKeyValueDirectory& store_;
    const interfaces::IClock& clock_;
};

}
