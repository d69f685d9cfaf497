#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace pairlink {

inline constexpr uint32_t kPairingProtocolVersion = 1;
inline constexpr uint32_t kIdentityStateVersion = 1;

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;
inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kSha256Bytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;
inline constexpr size_t kIdentitySealSaltBytes = 16;

inline constexpr size_t kSessionTokenBytes = 16;
inline constexpr size_t kTokenPrefixBytes = 4;
inline constexpr size_t kHandshakeNonceBytes = 16;
inline constexpr size_t kPairingKeyBytes = 32;
inline constexpr size_t kKeyConfirmationBytes = 32;
inline constexpr size_t kPeerIdentifierDigestBytes = 20;

inline constexpr size_t kShareCodeLength = 6;
inline constexpr std::string_view kShareCodeAlphabet = "23456789ABCDEFGHJKMNPQRSTUVWXYZ";
inline constexpr uint32_t kShareCodeRadix = static_cast<uint32_t>(kShareCodeAlphabet.size());
inline constexpr uint32_t kShareCodeSpace =
    kShareCodeRadix * kShareCodeRadix * kShareCodeRadix *
    kShareCodeRadix * kShareCodeRadix * kShareCodeRadix;
static_assert(kShareCodeRadix == 31, "Share code alphabet must hold 31 characters");
static_assert(kShareCodeSpace >= 100'000'000u, "Share code space must hold at least 1e8 codes");

inline constexpr std::string_view kShareCodeNamespace = "/pairlink/share-code/";
inline constexpr std::string_view kRelayAddressMarker = "/p2p-circuit";

inline constexpr std::string_view kRequestTranscriptLabel = "PairLink-Pairing-Request-v1";
inline constexpr std::string_view kResponseTranscriptLabel = "PairLink-Pairing-Response-v1";
inline constexpr std::string_view kPairingKeyInfo = "PairLink-Pairing-Key";
inline constexpr std::string_view kKeyConfirmationInfo = "PairLink-KeyConfirm-R";
inline constexpr std::string_view kIdentitySealInfo = "PairLink-Identity-Seal";
inline constexpr std::string_view kIdentitySealAad = "PairLink-Identity-v1";

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
};

struct PairingDefaults {
    static constexpr std::chrono::seconds CODE_TTL{300};
    static constexpr std::chrono::seconds MIN_CODE_TTL{30};
    static constexpr std::chrono::seconds MAX_CODE_TTL{3600};
    static constexpr std::chrono::seconds CONSUMER_SESSION_TTL{120};
    static constexpr std::chrono::milliseconds PUBLISH_TIMEOUT{10'000};
    static constexpr std::chrono::milliseconds RESOLVE_TIMEOUT{10'000};
    static constexpr std::chrono::milliseconds DIRECT_TIMEOUT{5'000};
    static constexpr std::chrono::milliseconds HOLE_PUNCH_TIMEOUT{10'000};
    static constexpr std::chrono::milliseconds RELAY_TIMEOUT{15'000};
    static constexpr std::chrono::milliseconds SWEEP_INTERVAL{1'000};
    static constexpr std::chrono::seconds TERMINAL_GRACE{30};
    static constexpr uint32_t REPUBLISH_DIVISOR = 3;
    static constexpr std::chrono::milliseconds RETRY_INITIAL_BACKOFF{1'000};
    static constexpr std::chrono::milliseconds RETRY_MAX_BACKOFF{30'000};
    static constexpr std::chrono::minutes REPLAY_NONCE_LIFETIME{10};
    static constexpr std::chrono::seconds MAX_CLOCK_SKEW{60};
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view GENERIC_HANDSHAKE_FAILURE = "Pairing handshake rejected";
    static constexpr std::string_view UNKNOWN_SESSION = "No pairing session for token";
};

}
