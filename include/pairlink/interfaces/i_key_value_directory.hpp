#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pairlink::interfaces {

/**
 * @brief DHT-like key/value store consumed by the rendezvous directory
 *
 * Best effort and eventually consistent. Implementations honour `timeout`
 * as well as they can; callers re-check the deadline on return anyway.
 * A transport-level failure is reported as DirectoryUnavailable, an absent
 * key as Ok(std::nullopt).
 */
class IKeyValueDirectory {
public:
    virtual ~IKeyValueDirectory() = default;

    virtual Result<Unit, PairingFailure> Put(
        std::span<const uint8_t> key,
        std::vector<uint8_t> value,
        std::chrono::seconds ttl,
        std::chrono::milliseconds timeout) = 0;

    virtual Result<std::optional<std::vector<uint8_t>>, PairingFailure> Get(
        std::span<const uint8_t> key,
        std::chrono::milliseconds timeout) = 0;

    virtual Result<Unit, PairingFailure> Remove(std::span<const uint8_t> key) = 0;
};

}
