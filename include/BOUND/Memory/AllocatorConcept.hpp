/// @file AllocatorConcept.hpp
/// @brief Allocator concept and traits used by heap-capable text storage.
#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <type_traits>

namespace BOUND::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required. Allocate may return nullptr on
    // failure; callers translate that into std::bad_alloc.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    template<class A>
    struct AllocatorTraits
    {
        static constexpr bool HasMaxSizeCapability = AllocatorReportsMaxSize<A>;

        // Unknown limits are reported as unbounded
        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (HasMaxSizeCapability)
            {
                return allocator.MaxSize();
            }
            else
            {
                return std::numeric_limits<std::size_t>::max();
            }
        }
    };
}// namespace BOUND::Memory
