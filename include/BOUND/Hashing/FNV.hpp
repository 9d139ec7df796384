// FNV.hpp
// FNV-1a 64-bit hash used for content hashing of validated text
#pragma once

#include <BOUND/Primitives.hpp>
#include <string_view>

namespace BOUND::Hashing
{
    /// @brief Compute FNV-1a 64-bit hash (byte buffer).
    /// @tparam Offset Initial offset basis (default 14695981039346656037ULL).
    /// @tparam Prime  FNV prime (default 1099511628211ULL).
    template<UInt64 Offset = 14695981039346656037ull, UInt64 Prime = 1099511628211ull>
    constexpr UInt64 FNV1a64(const UInt8* data, UIntSize len) noexcept
    {
        UInt64 hash = Offset;
        for (UIntSize i = 0; i < len; ++i)
            hash = (hash ^ data[i]) * Prime;
        return hash;
    }

    /// @brief Compute FNV-1a 64-bit hash for a string_view.
    template<UInt64 Offset = 14695981039346656037ull, UInt64 Prime = 1099511628211ull>
    constexpr UInt64 FNV1a64(std::string_view sv) noexcept
    {
        UInt64 hash = Offset;
        for (UIntSize i = 0; i < sv.size(); ++i)
            hash = (hash ^ static_cast<UInt8>(sv[i])) * Prime;
        return hash;
    }
}// namespace BOUND::Hashing
