/// @file SecurityPolicy.hpp
/// @brief Secure-erase and constant-time equality switches for bounded text.
#pragma once

#include <concepts>

namespace BOUND::Text
{
    template<class P>
    concept SecurityPolicyConcept =
            requires {
                { P::SecureErase } -> std::convertible_to<bool>;
                { P::ConstantTimeEquality } -> std::convertible_to<bool>;
            };

    /// @tparam Erase      Wipe every released byte (destruction, replaced storage, discarded scratch).
    /// @tparam ConstantTime operator== does not exit early on the first differing byte.
    template<bool Erase, bool ConstantTime>
    struct SecurityPolicy
    {
        static constexpr bool SecureErase          = Erase;
        static constexpr bool ConstantTimeEquality = ConstantTime;
    };

    using StandardSecurity = SecurityPolicy<false, false>;
    using SecretSecurity   = SecurityPolicy<true, true>;
}// namespace BOUND::Text
