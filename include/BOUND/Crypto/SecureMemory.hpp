/// @file SecureMemory.hpp
/// @brief Wipe and comparison helpers for sensitive byte buffers.
#pragma once

#include <BOUND/Primitives.hpp>

#include <atomic>

namespace BOUND::Crypto
{
    /// @brief Overwrites `len` bytes with zero through volatile stores the optimizer cannot drop.
    inline void SecureWipe(void* data, UIntSize len) noexcept
    {
        if (!data)
            return;

        volatile UInt8* p = static_cast<volatile UInt8*>(data);
        while (len--)
        {
            *p++ = 0;
        }
        std::atomic_signal_fence(std::memory_order_seq_cst);
    }

    /// @brief Constant-time comparison of two equally sized buffers.
    /// @details Every byte is visited; the running time does not depend on where the
    ///          first mismatch occurs. Lengths are the caller's responsibility.
    [[nodiscard]] inline bool ConstantTimeEqual(const void* a, const void* b, UIntSize len) noexcept
    {
        if (!a || !b)
            return len == 0;

        const volatile UInt8* lhs = static_cast<const volatile UInt8*>(a);
        const volatile UInt8* rhs = static_cast<const volatile UInt8*>(b);

        UInt8 result = 0;
        for (UIntSize i = 0; i < len; ++i)
        {
            result |= static_cast<UInt8>(lhs[i] ^ rhs[i]);
        }
        return result == 0;
    }
}// namespace BOUND::Crypto
