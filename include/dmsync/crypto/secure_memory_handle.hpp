#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

namespace dmsync::crypto {

/**
 * @brief Move-only owner of a sodium_malloc'd buffer
 *
 * Holds the local signing key for the lifetime of an identity. The buffer
 * sits between guard pages, is locked in RAM and is zeroed when freed.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data in; bytes past data.size() are zeroed
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Run func over a read-only view of the buffer without copying it out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    [[nodiscard]] size_t Size() const noexcept { return size_; }
    [[nodiscard]] bool IsInvalid() const noexcept { return ptr_ == nullptr; }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace dmsync::crypto
