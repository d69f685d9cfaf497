#pragma once

#include "pairlink/core/constants.hpp"
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace pairlink::configuration {

/**
 * @brief Timing and policy knobs for the pairing core
 *
 * Value type. Start from Default() (production) or ForTesting() (short
 * intervals, meant to be driven by a manual clock) and adjust single
 * fields with the With* modifiers, which return a modified copy:
 *
 * ```cpp
 * auto config = PairingConfig::Default()
 *     .WithRequireConsumerConfirmation(true)
 *     .WithTerminalGrace(std::chrono::seconds(10));
 * if (auto valid = config.Validate(); valid.IsErr()) { ... }
 * ```
 *
 * **Expiry**: a generated code lives for `CodeTtl()` unless the caller
 * asks for another lifetime, which is clamped into
 * [MinCodeTtl(), MaxCodeTtl()]. A consumer session lives for
 * `ConsumerSessionTtl()` from the moment the code is entered.
 *
 * **Republish**: an Issuer re-publishes its record every
 * `ttl / RepublishDivisor()`, so the directory copy never lapses while
 * the session is alive.
 *
 * **Retry**: DirectoryUnavailable is retried after RetryInitialBackoff(),
 * doubling up to RetryMaxBackoff(), until the session expires.
 */
class PairingConfig {
public:
    using Seconds = std::chrono::seconds;
    using Millis = std::chrono::milliseconds;

    [[nodiscard]] static constexpr PairingConfig Default() noexcept {
        return PairingConfig();
    }

    /// Short timers for deterministic tests. All intervals stay well below
    /// the code lifetime so expiry and republish can both be observed.
    [[nodiscard]] static constexpr PairingConfig ForTesting() noexcept {
        PairingConfig config;
        config.code_ttl_ = Seconds(120);
        config.consumer_session_ttl_ = Seconds(60);
        config.publish_timeout_ = Millis(1'000);
        config.resolve_timeout_ = Millis(1'000);
        config.direct_timeout_ = Millis(500);
        config.hole_punch_timeout_ = Millis(1'000);
        config.relay_timeout_ = Millis(1'000);
        config.sweep_interval_ = Millis(100);
        config.terminal_grace_ = Seconds(2);
        config.retry_initial_backoff_ = Millis(100);
        config.retry_max_backoff_ = Millis(1'000);
        return config;
    }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    [[nodiscard]] constexpr Seconds CodeTtl() const noexcept { return code_ttl_; }
    [[nodiscard]] constexpr Seconds MinCodeTtl() const noexcept { return min_code_ttl_; }
    [[nodiscard]] constexpr Seconds MaxCodeTtl() const noexcept { return max_code_ttl_; }
    [[nodiscard]] constexpr Seconds ConsumerSessionTtl() const noexcept { return consumer_session_ttl_; }
    [[nodiscard]] constexpr Millis PublishTimeout() const noexcept { return publish_timeout_; }
    [[nodiscard]] constexpr Millis ResolveTimeout() const noexcept { return resolve_timeout_; }
    [[nodiscard]] constexpr Millis DirectTimeout() const noexcept { return direct_timeout_; }
    [[nodiscard]] constexpr Millis HolePunchTimeout() const noexcept { return hole_punch_timeout_; }
    [[nodiscard]] constexpr Millis RelayTimeout() const noexcept { return relay_timeout_; }
    [[nodiscard]] constexpr Millis SweepInterval() const noexcept { return sweep_interval_; }
    [[nodiscard]] constexpr Seconds TerminalGrace() const noexcept { return terminal_grace_; }
    [[nodiscard]] constexpr uint32_t RepublishDivisor() const noexcept { return republish_divisor_; }
    [[nodiscard]] constexpr Millis RetryInitialBackoff() const noexcept { return retry_initial_backoff_; }
    [[nodiscard]] constexpr Millis RetryMaxBackoff() const noexcept { return retry_max_backoff_; }
    [[nodiscard]] constexpr std::chrono::minutes ReplayNonceLifetime() const noexcept { return replay_nonce_lifetime_; }
    [[nodiscard]] constexpr Seconds MaxClockSkew() const noexcept { return max_clock_skew_; }
    [[nodiscard]] constexpr bool RequireConsumerConfirmation() const noexcept { return require_consumer_confirmation_; }

    /// Requested code lifetime clamped into the allowed window; zero means
    /// the configured default.
    [[nodiscard]] constexpr Seconds ClampCodeTtl(Seconds requested) const noexcept {
        if (requested <= Seconds::zero()) {
            return code_ttl_;
        }
        return std::clamp(requested, min_code_ttl_, max_code_ttl_);
    }

    /// Interval between republishes of a record with lifetime `ttl`.
    [[nodiscard]] constexpr Millis RepublishInterval(Seconds ttl) const noexcept {
        return std::chrono::duration_cast<Millis>(ttl) / republish_divisor_;
    }

    /// Backoff before retry number `attempt` (0-based).
    [[nodiscard]] constexpr Millis RetryBackoff(uint32_t attempt) const noexcept {
        Millis backoff = retry_initial_backoff_;
        for (uint32_t i = 0; i < attempt && backoff < retry_max_backoff_; ++i) {
            backoff *= 2;
        }
        return std::min(backoff, retry_max_backoff_);
    }

    // ------------------------------------------------------------------
    // Modifiers
    // ------------------------------------------------------------------

    [[nodiscard]] constexpr PairingConfig WithCodeTtl(Seconds value) const noexcept {
        PairingConfig copy = *this;
        copy.code_ttl_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithConsumerSessionTtl(Seconds value) const noexcept {
        PairingConfig copy = *this;
        copy.consumer_session_ttl_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithPublishTimeout(Millis value) const noexcept {
        PairingConfig copy = *this;
        copy.publish_timeout_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithResolveTimeout(Millis value) const noexcept {
        PairingConfig copy = *this;
        copy.resolve_timeout_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithTierTimeouts(Millis direct, Millis hole_punch, Millis relay) const noexcept {
        PairingConfig copy = *this;
        copy.direct_timeout_ = direct;
        copy.hole_punch_timeout_ = hole_punch;
        copy.relay_timeout_ = relay;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithSweepInterval(Millis value) const noexcept {
        PairingConfig copy = *this;
        copy.sweep_interval_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithTerminalGrace(Seconds value) const noexcept {
        PairingConfig copy = *this;
        copy.terminal_grace_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithRepublishDivisor(uint32_t value) const noexcept {
        PairingConfig copy = *this;
        copy.republish_divisor_ = value;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithRetryBackoff(Millis initial, Millis maximum) const noexcept {
        PairingConfig copy = *this;
        copy.retry_initial_backoff_ = initial;
        copy.retry_max_backoff_ = maximum;
        return copy;
    }

    [[nodiscard]] constexpr PairingConfig WithRequireConsumerConfirmation(bool value) const noexcept {
        PairingConfig copy = *this;
        copy.require_consumer_confirmation_ = value;
        return copy;
    }

    /**
     * @brief Check internal consistency
     *
     * Rejects zero timeouts, a republish divisor below 2 (the record would
     * lapse before it is refreshed), inverted ttl or backoff bounds and a
     * default ttl outside its own bounds.
     */
    [[nodiscard]] Result<Unit, PairingFailure> Validate() const {
        if (min_code_ttl_ <= Seconds::zero() || min_code_ttl_ > max_code_ttl_) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Code ttl bounds are inverted or zero"));
        }
        if (code_ttl_ < min_code_ttl_ || code_ttl_ > max_code_ttl_) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Default code ttl outside allowed bounds"));
        }
        if (consumer_session_ttl_ <= Seconds::zero()) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Consumer session ttl must be positive"));
        }
        if (publish_timeout_ <= Millis::zero() || resolve_timeout_ <= Millis::zero() ||
            direct_timeout_ <= Millis::zero() || hole_punch_timeout_ <= Millis::zero() ||
            relay_timeout_ <= Millis::zero() || sweep_interval_ <= Millis::zero()) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Timeouts and intervals must be positive"));
        }
        if (republish_divisor_ < 2) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Republish divisor must be at least 2"));
        }
        if (retry_initial_backoff_ <= Millis::zero() || retry_initial_backoff_ > retry_max_backoff_) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Retry backoff bounds are inverted or zero"));
        }
        if (terminal_grace_ < Seconds::zero()) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::InvalidState("Terminal grace must not be negative"));
        }
        return Result<Unit, PairingFailure>::Ok(unit);
    }

    [[nodiscard]] constexpr bool operator==(const PairingConfig& other) const noexcept = default;

private:
    constexpr PairingConfig() noexcept = default;

    Seconds code_ttl_ = PairingDefaults::CODE_TTL;
    Seconds min_code_ttl_ = PairingDefaults::MIN_CODE_TTL;
    Seconds max_code_ttl_ = PairingDefaults::MAX_CODE_TTL;
    Seconds consumer_session_ttl_ = PairingDefaults::CONSUMER_SESSION_TTL;
    Millis publish_timeout_ = PairingDefaults::PUBLISH_TIMEOUT;
    Millis resolve_timeout_ = PairingDefaults::RESOLVE_TIMEOUT;
    Millis direct_timeout_ = PairingDefaults::DIRECT_TIMEOUT;
    Millis hole_punch_timeout_ = PairingDefaults::HOLE_PUNCH_TIMEOUT;
    Millis relay_timeout_ = PairingDefaults::RELAY_TIMEOUT;
    Millis sweep_interval_ = PairingDefaults::SWEEP_INTERVAL;
    Seconds terminal_grace_ = PairingDefaults::TERMINAL_GRACE;
    uint32_t republish_divisor_ = PairingDefaults::REPUBLISH_DIVISOR;
    Millis retry_initial_backoff_ = PairingDefaults::RETRY_INITIAL_BACKOFF;
    Millis retry_max_backoff_ = PairingDefaults::RETRY_MAX_BACKOFF;
    std::chrono::minutes replay_nonce_lifetime_ = PairingDefaults::REPLAY_NONCE_LIFETIME;
    Seconds max_clock_skew_ = PairingDefaults::MAX_CLOCK_SKEW;
    bool require_consumer_confirmation_ = false;
};

} // namespace pairlink::configuration
