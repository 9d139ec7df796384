/// @file AuditingAllocator.hpp
/// @brief Decorator allocator that records allocation statistics and whether
///        released blocks were wiped before being handed back.
#pragma once

#include <cstddef>
#include <limits>
#include <utility>

#include <BOUND/Memory/AllocatorConcept.hpp>
#include <BOUND/Memory/SystemAllocator.hpp>
#include <BOUND/Primitives.hpp>

namespace BOUND::Memory
{
    /// @brief Shared audit record. Copies of an `Auditing` allocator report into the same record.
    struct AllocationAudit
    {
        std::size_t currentBytes {0};
        std::size_t peakBytes {0};
        std::size_t currentCount {0};
        std::size_t totalCount {0};
        std::size_t failedCount {0};
        /// Released blocks whose bytes were all zero at release time.
        std::size_t wipedReleases {0};
        /// Released blocks that still held non-zero bytes.
        std::size_t dirtyReleases {0};
        /// Number of further allocations allowed to succeed before Allocate returns nullptr.
        std::size_t allocationsUntilFailure {std::numeric_limits<std::size_t>::max()};

        void Reset() noexcept { *this = AllocationAudit {}; }
    };

    template<AllocatorConcept Inner = SystemAllocator>
    class Auditing
    {
    public:
        Auditing() = default;
        explicit Auditing(AllocationAudit& audit, Inner inner = Inner {})
            : m_inner(std::move(inner)), m_audit(&audit)
        {
        }

        [[nodiscard]] void* Allocate(std::size_t size, std::size_t align) noexcept
        {
            if (m_audit && m_audit->allocationsUntilFailure == 0)
            {
                ++m_audit->failedCount;
                return nullptr;
            }
            void* p = m_inner.Allocate(size, align);
            if (p && m_audit)
            {
                if (m_audit->allocationsUntilFailure != std::numeric_limits<std::size_t>::max())
                    --m_audit->allocationsUntilFailure;
                m_audit->currentBytes += size;
                m_audit->currentCount += 1;
                m_audit->totalCount += 1;
                if (m_audit->currentBytes > m_audit->peakBytes)
                    m_audit->peakBytes = m_audit->currentBytes;
            }
            return p;
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t align) noexcept
        {
            if (ptr && m_audit)
            {
                const auto* bytes = static_cast<const UInt8*>(ptr);
                UInt8       seen  = 0;
                for (std::size_t i = 0; i < size; ++i)
                    seen |= bytes[i];
                if (seen == 0)
                    ++m_audit->wipedReleases;
                else
                    ++m_audit->dirtyReleases;

                m_audit->currentBytes = m_audit->currentBytes >= size ? m_audit->currentBytes - size : 0;
                if (m_audit->currentCount > 0)
                    m_audit->currentCount -= 1;
            }
            m_inner.Deallocate(ptr, size, align);
        }

        [[nodiscard]] std::size_t MaxSize() const noexcept
        {
            return AllocatorTraits<Inner>::MaxSize(m_inner);
        }

        [[nodiscard]] const AllocationAudit* GetAudit() const noexcept { return m_audit; }

        friend bool operator==(const Auditing& a, const Auditing& b) noexcept
        {
            return a.m_audit == b.m_audit;
        }

    private:
        [[no_unique_address]] Inner m_inner {};
        AllocationAudit*            m_audit {nullptr};
    };
}// namespace BOUND::Memory
