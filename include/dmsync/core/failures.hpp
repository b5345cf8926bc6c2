#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
namespace dmsync {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class DmFailureType {
    Generic,
    InvalidInput,
    InvalidState,
    Encode,
    Decode,
    KeyGeneration,
    DeriveKey,
    DecryptionFailed,
    MalformedEnvelope,
    RelayResolutionDegraded,
    RelayQueryFailed,
    PublishFailed,
    PublishPartialFailure,
    StoreFailed,
    Cancelled
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class DmFailure {
public:
    DmFailureType type;
    std::string message;
    DmFailure(const DmFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static DmFailure Generic(std::string msg) {
        return {DmFailureType::Generic, std::move(msg)};
    }
    static DmFailure InvalidInput(std::string msg) {
        return {DmFailureType::InvalidInput, std::move(msg)};
    }
    static DmFailure InvalidState(std::string msg) {
        return {DmFailureType::InvalidState, std::move(msg)};
    }
    static DmFailure Encode(std::string msg) {
        return {DmFailureType::Encode, std::move(msg)};
    }
    static DmFailure Decode(std::string msg) {
        return {DmFailureType::Decode, std::move(msg)};
    }
    static DmFailure KeyGeneration(std::string msg) {
        return {DmFailureType::KeyGeneration, std::move(msg)};
    }
    static DmFailure DeriveKey(std::string msg) {
        return {DmFailureType::DeriveKey, std::move(msg)};
    }
    static DmFailure DecryptionFailed(std::string msg) {
        return {DmFailureType::DecryptionFailed, std::move(msg)};
    }
    static DmFailure MalformedEnvelope(std::string msg) {
        return {DmFailureType::MalformedEnvelope, std::move(msg)};
    }
    static DmFailure RelayResolutionDegraded(std::string msg) {
        return {DmFailureType::RelayResolutionDegraded, std::move(msg)};
    }
    static DmFailure RelayQueryFailed(std::string msg) {
        return {DmFailureType::RelayQueryFailed, std::move(msg)};
    }
    static DmFailure PublishFailed(std::string msg) {
        return {DmFailureType::PublishFailed, std::move(msg)};
    }
    static DmFailure PublishPartialFailure(std::string msg) {
        return {DmFailureType::PublishPartialFailure, std::move(msg)};
    }
    static DmFailure StoreFailed(std::string msg) {
        return {DmFailureType::StoreFailed, std::move(msg)};
    }
    static DmFailure Cancelled(std::string msg) {
        return {DmFailureType::Cancelled, std::move(msg)};
    }
    static DmFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsPerMessage() const noexcept {
        return type == DmFailureType::DecryptionFailed ||
               type == DmFailureType::MalformedEnvelope;
    }
};

enum class MessageProtocol : uint8_t {
    Legacy = 0,
    Private = 1
};

[[nodiscard]] constexpr std::string_view ProtocolName(const MessageProtocol protocol) noexcept {
    return protocol == MessageProtocol::Legacy ? "legacy" : "private";
}

/// Structured report of a relay problem, shown to the user as a dismissible notice.
struct RelayError {
    std::string message;
    std::optional<MessageProtocol> protocol;
    std::vector<std::string> failed_relays;
    size_t total_relays = 0;

    bool operator==(const RelayError& other) const = default;
};
}
