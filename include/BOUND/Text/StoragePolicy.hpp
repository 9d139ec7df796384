/// @file StoragePolicy.hpp
/// @brief Decides whether bounded text may leave its inline buffer.
#pragma once

#include <BOUND/Memory/AllocatorConcept.hpp>
#include <BOUND/Memory/SystemAllocator.hpp>

#include <concepts>

namespace BOUND::Text
{
    template<class P>
    concept StoragePolicyConcept =
            requires {
                { P::AllowsHeap } -> std::convertible_to<bool>;
                typename P::AllocatorType;
            } && Memory::AllocatorConcept<typename P::AllocatorType>;

    /// @brief Fixed footprint: text that does not fit inline is rejected with `TooManyBytes`.
    struct StackOnly
    {
        static constexpr bool AllowsHeap = false;
        // Never used to allocate; present so both strategies expose the same shape.
        using AllocatorType = Memory::SystemAllocator;
    };

    /// @brief Text larger than the inline buffer is promoted to a heap buffer from `Alloc`.
    template<Memory::AllocatorConcept Alloc = Memory::SystemAllocator>
    struct HeapAllowed
    {
        static constexpr bool AllowsHeap = true;
        using AllocatorType              = Alloc;
    };

    static_assert(StoragePolicyConcept<StackOnly>);
    static_assert(StoragePolicyConcept<HeapAllowed<>>);
}// namespace BOUND::Text
