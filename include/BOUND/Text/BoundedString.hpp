/// @file BoundedString.hpp
/// @brief Validated, bounded UTF-8 string with inline storage and optional heap promotion.
///
/// Logical length always lies in [MinLength, MaxLength] and content always satisfies the
/// format policy. Mutation works on a scratch copy that is validated before it is committed.
#pragma once

#include <BOUND/Crypto/SecureMemory.hpp>
#include <BOUND/Defines.hpp>
#include <BOUND/Hashing/FNV.hpp>
#include <BOUND/Memory/AllocatorConcept.hpp>
#include <BOUND/Primitives.hpp>
#include <BOUND/Text/BoundedStringError.hpp>
#include <BOUND/Text/FormatPolicy.hpp>
#include <BOUND/Text/LengthPolicy.hpp>
#include <BOUND/Text/SecurityPolicy.hpp>
#include <BOUND/Text/StoragePolicy.hpp>
#include <BOUND/Text/Utf8.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <expected>
#include <functional>
#include <new>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

namespace BOUND::Text
{
    /// @brief Which representation currently backs a bounded string.
    enum class StorageKind : UInt8
    {
        Inline,
        Heap,
    };

    /// @brief Scratch buffer handed to a `BoundedString::Mutate` callback.
    ///
    /// The callback may write any byte inside `[0, Capacity())` and report a new size with
    /// `SetSize`. Nothing is checked until the callback returns.
    class MutableBytes
    {
    public:
        constexpr MutableBytes(char* data, UIntSize size, UIntSize capacity) noexcept
            : m_data(data), m_size(size), m_capacity(capacity)
        {
        }

        MutableBytes(const MutableBytes&)            = delete;
        MutableBytes& operator=(const MutableBytes&) = delete;

        [[nodiscard]] constexpr char*       Data() noexcept { return m_data; }
        [[nodiscard]] constexpr const char* Data() const noexcept { return m_data; }
        [[nodiscard]] constexpr UIntSize    Size() const noexcept { return m_size; }
        [[nodiscard]] constexpr UIntSize    Capacity() const noexcept { return m_capacity; }

        /// Reports the new byte size. Values above Capacity() are rejected on commit.
        constexpr void SetSize(UIntSize size) noexcept { m_size = size; }

        /// Whole scratch capacity, not just the current size.
        [[nodiscard]] constexpr std::span<char> AsSpan() noexcept { return {m_data, m_capacity}; }

        [[nodiscard]] constexpr std::string_view View() const noexcept
        {
            return {m_data, std::min(m_size, m_capacity)};
        }

    private:
        char*    m_data {nullptr};
        UIntSize m_size {0};
        UIntSize m_capacity {0};
    };

    //--------------------------------------------------------------------------
    // BoundedString
    //--------------------------------------------------------------------------

    template<UIntSize MinLength,
             UIntSize MaxLength,
             UIntSize InlineBytes,
             LengthPolicyConcept   LengthP   = Bytes,
             FormatPolicyConcept   FormatP   = AllowAll,
             StoragePolicyConcept  StorageP  = StackOnly,
             SecurityPolicyConcept SecurityP = StandardSecurity>
    /// Validated, bounded UTF-8 string with inline storage and optional heap promotion.
    /// Note: single owner; not thread-safe. Every instance satisfies its bounds.
    class BoundedString
    {
        static_assert(MinLength <= MaxLength, "MinLength must be <= MaxLength.");

    public:
        using ThisType       = BoundedString<MinLength, MaxLength, InlineBytes, LengthP, FormatP, StorageP, SecurityP>;
        using LengthPolicy   = LengthP;
        using FormatPolicy   = FormatP;
        using StoragePolicy  = StorageP;
        using SecurityPolicy = SecurityP;
        using AllocatorType  = typename StorageP::AllocatorType;
        using value_type     = char;
        using size_type      = UIntSize;

        static constexpr UIntSize MinLogicalLength = MinLength;
        static constexpr UIntSize MaxLogicalLength = MaxLength;
        static constexpr UIntSize InlineCapacity   = InlineBytes;
        static constexpr bool     AllowsHeap       = StorageP::AllowsHeap;

        /// Largest byte size a heap-backed value may reach, and the capacity of the heap
        /// mutation scratch buffer. No text above it can satisfy MaxLength.
        static constexpr UIntSize HeapCeiling = std::max(InlineBytes, LengthP::MaxBytesFor(MaxLength));

    private:
        // Inline arrays need at least one element; a heap-only string still reports zero capacity.
        static constexpr UIntSize InlineStorageBytes = std::max<UIntSize>(InlineBytes, 1);

    public:

        /// @brief Text checked at compile time. Ill-formed or out-of-bounds literals do not compile.
        class Literal
        {
        public:
            template<UIntSize N>
            consteval Literal(const char (&text)[N])
                : m_text(text, N - 1)
            {
                if (!ThisType::Validate(m_text).has_value())
                    throw "BoundedString literal violates its bounds or format";
            }

            [[nodiscard]] constexpr std::string_view View() const noexcept { return m_text; }

        private:
            std::string_view m_text;
        };

    private:
        struct ValidatedTag
        {
            explicit ValidatedTag() = default;
        };

    public:
        //--------------------------------------------------------------------------
        // Construction
        //--------------------------------------------------------------------------

        /// @brief Full validation without constructing anything. Constant-evaluable.
        ///
        /// Order: UTF-8 well-formedness, logical length, format, byte capacity.
        [[nodiscard]] static constexpr BoundedExpected<void> Validate(std::string_view text) noexcept
        {
            if (!Utf8::IsValid(text))
                return std::unexpected(BoundedStringError::InvalidContent);
            if (auto content = CheckContent(text); !content)
                return content;
            if (text.size() > InlineBytes)
            {
                if constexpr (!AllowsHeap)
                    return std::unexpected(BoundedStringError::TooManyBytes);
                if (text.size() > HeapCeiling)
                    return std::unexpected(BoundedStringError::TooManyBytes);
            }
            return {};
        }

        /// @brief Validates `text` and copies it into a new value. Nothing is copied on failure.
        [[nodiscard]] static constexpr BoundedExpected<ThisType> Create(std::string_view     text,
                                                                        const AllocatorType& allocator = AllocatorType {})
        {
            if (auto valid = Validate(text); !valid)
                return std::unexpected(valid.error());
            return BoundedExpected<ThisType>(std::in_place, ValidatedTag {}, text, allocator);
        }

        constexpr BoundedString(Literal literal, const AllocatorType& allocator = AllocatorType {})
            : m_allocator(allocator)
        {
            InitFromValidated(literal.View());
        }

        constexpr BoundedString(ValidatedTag, std::string_view text, const AllocatorType& allocator)
            : m_allocator(allocator)
        {
            InitFromValidated(text);
        }

        constexpr BoundedString(const ThisType& other)
            : m_allocator(other.m_allocator)
        {
            CopyFrom(other);
        }

        // A moved-from value must stay in bounds, so the source keeps its bytes and the
        // destination takes a copy.
        constexpr BoundedString(ThisType&& other)
            : BoundedString(std::as_const(other))
        {
        }

        constexpr ~BoundedString()
        {
            ReleaseStorage();
        }

        //--------------------------------------------------------------------------
        // Assignment
        //--------------------------------------------------------------------------

        constexpr ThisType& operator=(const ThisType& other)
        {
            if (this == &other)
                return *this;
            ThisType copy(other);
            Swap(copy);
            return *this;
        }

        /// Both sides stay valid: the contents are exchanged.
        constexpr ThisType& operator=(ThisType&& other) noexcept
        {
            if (this != &other)
                Swap(other);
            return *this;
        }

        /// @brief Validated replacement. May change representation; untouched on failure.
        constexpr BoundedExpected<void> Assign(std::string_view text)
        {
            if (auto valid = Validate(text); !valid)
                return valid;
            // Built before the swap so `text` may alias our own buffer.
            ThisType replacement(ValidatedTag {}, text, m_allocator);
            Swap(replacement);
            return {};
        }

        constexpr void Swap(ThisType& other) noexcept
        {
            using std::swap;
            swap(m_allocator, other.m_allocator);
            Storage temp    = m_storage;
            m_storage       = other.m_storage;
            other.m_storage = temp;
            swap(m_kind, other.m_kind);
            if constexpr (SecurityP::SecureErase)
            {
                if (!std::is_constant_evaluated())
                    Crypto::SecureWipe(&temp, sizeof(temp));
            }
        }

        friend constexpr void swap(ThisType& a, ThisType& b) noexcept { a.Swap(b); }

        //--------------------------------------------------------------------------
        // Observers
        //--------------------------------------------------------------------------

        [[nodiscard]] constexpr std::string_view View() const noexcept
        {
            if (m_kind == StorageKind::Inline)
                return {m_storage.small.bytes, m_storage.small.size};
            return {m_storage.heap.ptr, m_storage.heap.size};
        }

        [[nodiscard]] constexpr const char* Data() const noexcept { return View().data(); }

        [[nodiscard]] constexpr UIntSize ByteLength() const noexcept
        {
            return m_kind == StorageKind::Inline ? m_storage.small.size : m_storage.heap.size;
        }

        /// Recomputed from the content on each call.
        [[nodiscard]] constexpr UIntSize LogicalLength() const noexcept
        {
            return LengthP::LogicalLength(View());
        }

        [[nodiscard]] constexpr UIntSize Capacity() const noexcept
        {
            return m_kind == StorageKind::Inline ? InlineBytes : m_storage.heap.capacity;
        }

        [[nodiscard]] constexpr StorageKind GetStorageKind() const noexcept { return m_kind; }
        [[nodiscard]] constexpr bool        IsInline() const noexcept { return m_kind == StorageKind::Inline; }
        [[nodiscard]] constexpr bool        IsHeap() const noexcept { return m_kind == StorageKind::Heap; }

        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }

        constexpr operator std::string_view() const noexcept { return View(); }

        const char* begin() const noexcept { return Data(); }
        const char* end() const noexcept { return Data() + ByteLength(); }

        /// FNV-1a 64 of the content; independent of the representation.
        [[nodiscard]] constexpr UInt64 Hash() const noexcept { return Hashing::FNV1a64(View()); }

        //--------------------------------------------------------------------------
        // Mutation
        //--------------------------------------------------------------------------

        /// @brief Runs `mutator` on a scratch copy and commits the result only if it is valid.
        ///
        /// `mutator` is called as `mutator(MutableBytes&)`. Its return value is forwarded on success.
        /// Errors: `TooManyBytes` if the reported size exceeds the scratch capacity,
        /// `MutationFailed` for ill-formed UTF-8, out-of-range logical length or rejected format.
        /// Exceptions thrown by `mutator` propagate, as does `std::bad_alloc` from heap scratch or
        /// commit allocation; the value is unchanged in every failure case.
        ///
        /// The representation never changes here: inline values keep InlineBytes of room and
        /// heap values stay on the heap even when they shrink.
        template<class F>
            requires std::invocable<F&, MutableBytes&>
        auto Mutate(F&& mutator) -> BoundedExpected<std::decay_t<std::invoke_result_t<F&, MutableBytes&>>>
        {
            using Result = std::decay_t<std::invoke_result_t<F&, MutableBytes&>>;
            if (m_kind == StorageKind::Inline)
                return MutateInline<Result>(mutator);
            if constexpr (AllowsHeap)
                return MutateHeap<Result>(mutator);
            else
                Unreachable();
        }

        //--------------------------------------------------------------------------
        // Comparison
        //--------------------------------------------------------------------------

        /// @brief Equality whose cost does not depend on the position of the first difference.
        ///
        /// Byte lengths are compared first. Two inline values compare their whole inline buffers
        /// (the tail past the length is always zero); otherwise the content bytes are compared.
        [[nodiscard]] bool ConstantTimeEquals(const ThisType& other) const noexcept
        {
            if (ByteLength() != other.ByteLength())
                return false;
            if (IsInline() && other.IsInline())
                return Crypto::ConstantTimeEqual(m_storage.small.bytes, other.m_storage.small.bytes, InlineStorageBytes);
            return Crypto::ConstantTimeEqual(Data(), other.Data(), ByteLength());
        }

        friend constexpr bool operator==(const ThisType& a, const ThisType& b) noexcept
        {
            if constexpr (SecurityP::ConstantTimeEquality)
            {
                if (!std::is_constant_evaluated())
                    return a.ConstantTimeEquals(b);
            }
            return a.View() == b.View();
        }

        friend constexpr bool operator==(const ThisType& a, std::string_view b) noexcept
        {
            return a.View() == b;
        }

        friend constexpr std::strong_ordering operator<=>(const ThisType& a, const ThisType& b) noexcept
        {
            return a.View() <=> b.View();
        }

        friend constexpr std::strong_ordering operator<=>(const ThisType& a, std::string_view b) noexcept
        {
            return a.View() <=> b;
        }

        friend std::ostream& operator<<(std::ostream& os, const ThisType& value)
        {
            return os << value.View();
        }

    private:
        struct InlineRep
        {
            char     bytes[InlineStorageBytes];
            UIntSize size;
        };

        struct HeapRep
        {
            char*    ptr;
            UIntSize size;
            UIntSize capacity;
        };

        union Storage
        {
            InlineRep small;
            HeapRep   heap;

            constexpr Storage() noexcept
                : small {}
            {
            }
        };

        // Owns a heap scratch block until it is committed; wipes and frees it otherwise.
        class HeapScratch
        {
        public:
            HeapScratch(AllocatorType& allocator, UIntSize capacity)
                : m_allocator(allocator), m_ptr(AllocateBytes(allocator, capacity)), m_capacity(capacity)
            {
            }

            HeapScratch(const HeapScratch&)            = delete;
            HeapScratch& operator=(const HeapScratch&) = delete;

            ~HeapScratch()
            {
                if (m_ptr)
                    ReleaseBytes(m_allocator, m_ptr, m_capacity);
            }

            [[nodiscard]] char* Get() const noexcept { return m_ptr; }

            [[nodiscard]] char* Release() noexcept { return std::exchange(m_ptr, nullptr); }

        private:
            AllocatorType& m_allocator;
            char*          m_ptr {nullptr};
            UIntSize       m_capacity {0};
        };

        struct InlineScratch
        {
            char bytes[InlineStorageBytes] {};

            InlineScratch() = default;
            InlineScratch(const InlineScratch&)            = delete;
            InlineScratch& operator=(const InlineScratch&) = delete;

            ~InlineScratch()
            {
                if constexpr (SecurityP::SecureErase)
                    Crypto::SecureWipe(bytes, InlineStorageBytes);
            }
        };

        [[nodiscard]] static constexpr BoundedExpected<void> CheckContent(std::string_view text) noexcept
        {
            const UIntSize logical = LengthP::LogicalLength(text);
            if (logical < MinLength)
                return std::unexpected(BoundedStringError::TooShort);
            if (logical > MaxLength)
                return std::unexpected(BoundedStringError::TooLong);
            if (!FormatP::Accepts(text))
                return std::unexpected(BoundedStringError::InvalidContent);
            return {};
        }

        [[nodiscard]] static BoundedExpected<void> CheckScratch(const MutableBytes& scratch) noexcept
        {
            if (scratch.Size() > scratch.Capacity())
                return std::unexpected(BoundedStringError::TooManyBytes);
            const std::string_view text = scratch.View();
            if (!Utf8::IsValid(text) || !CheckContent(text))
                return std::unexpected(BoundedStringError::MutationFailed);
            return {};
        }

        [[nodiscard]] static char* AllocateBytes(AllocatorType& allocator, UIntSize capacity)
        {
            if (capacity > Memory::AllocatorTraits<AllocatorType>::MaxSize(allocator))
                throw std::length_error("BoundedString capacity overflow");
            void* p = allocator.Allocate(capacity, alignof(char));
            if (!p)
                throw std::bad_alloc {};
            return static_cast<char*>(p);
        }

        static void ReleaseBytes(AllocatorType& allocator, char* ptr, UIntSize capacity) noexcept
        {
            if constexpr (SecurityP::SecureErase)
                Crypto::SecureWipe(ptr, capacity);
            allocator.Deallocate(ptr, capacity, alignof(char));
        }

        constexpr void InitFromValidated(std::string_view text)
        {
            const UIntSize n = text.size();
            if (n <= InlineBytes)
            {
                std::copy_n(text.data(), n, m_storage.small.bytes);
                m_storage.small.size = n;
                m_kind               = StorageKind::Inline;
                return;
            }
            if constexpr (AllowsHeap)
            {
                char* p = AllocateBytes(m_allocator, n);
                std::copy_n(text.data(), n, p);
                m_storage.heap = HeapRep {p, n, n};
                m_kind         = StorageKind::Heap;
            }
            else
            {
                Unreachable();
            }
        }

        constexpr void CopyFrom(const ThisType& other)
        {
            if (other.m_kind == StorageKind::Inline)
            {
                m_storage.small = other.m_storage.small;
                m_kind          = StorageKind::Inline;
                return;
            }
            if constexpr (AllowsHeap)
            {
                const UIntSize n = other.m_storage.heap.size;
                char*          p = AllocateBytes(m_allocator, n);
                std::copy_n(other.m_storage.heap.ptr, n, p);
                m_storage.heap = HeapRep {p, n, n};
                m_kind         = StorageKind::Heap;
            }
        }

        constexpr void ReleaseStorage() noexcept
        {
            if (m_kind == StorageKind::Heap)
            {
                ReleaseBytes(m_allocator, m_storage.heap.ptr, m_storage.heap.capacity);
                return;
            }
            if constexpr (SecurityP::SecureErase)
            {
                if (!std::is_constant_evaluated())
                    Crypto::SecureWipe(m_storage.small.bytes, InlineStorageBytes);
            }
        }

        template<class Result, class F>
        BoundedExpected<Result> MutateInline(F& mutator)
        {
            InlineScratch scratch;
            std::copy_n(m_storage.small.bytes, InlineStorageBytes, scratch.bytes);
            MutableBytes bytes(scratch.bytes, m_storage.small.size, InlineBytes);

            if constexpr (std::is_void_v<Result>)
            {
                std::invoke(mutator, bytes);
                if (auto check = CheckScratch(bytes); !check)
                    return check;
                CommitInline(bytes);
                return {};
            }
            else
            {
                Result result = std::invoke(mutator, bytes);
                if (auto check = CheckScratch(bytes); !check)
                    return std::unexpected(check.error());
                CommitInline(bytes);
                return BoundedExpected<Result>(std::in_place, std::move(result));
            }
        }

        template<class Result, class F>
        BoundedExpected<Result> MutateHeap(F& mutator)
        {
            HeapScratch scratch(m_allocator, HeapCeiling);
            const UIntSize size = m_storage.heap.size;
            std::copy_n(m_storage.heap.ptr, size, scratch.Get());
            std::fill_n(scratch.Get() + size, HeapCeiling - size, '\0');
            MutableBytes bytes(scratch.Get(), size, HeapCeiling);

            if constexpr (std::is_void_v<Result>)
            {
                std::invoke(mutator, bytes);
                if (auto check = CheckScratch(bytes); !check)
                    return check;
                CommitHeap(scratch, bytes);
                return {};
            }
            else
            {
                Result result = std::invoke(mutator, bytes);
                if (auto check = CheckScratch(bytes); !check)
                    return std::unexpected(check.error());
                CommitHeap(scratch, bytes);
                return BoundedExpected<Result>(std::in_place, std::move(result));
            }
        }

        void CommitInline(const MutableBytes& bytes) noexcept
        {
            const UIntSize n = bytes.Size();
            std::copy_n(bytes.Data(), n, m_storage.small.bytes);
            std::fill_n(m_storage.small.bytes + n, InlineStorageBytes - n, '\0');
            m_storage.small.size = n;
        }

        // Short results move into an exact-size block so a value does not keep the whole
        // scratch capacity; the scratch is then wiped and freed by its owner. Allocation
        // happens before any state changes.
        void CommitHeap(HeapScratch& scratch, const MutableBytes& bytes)
        {
            const UIntSize n        = bytes.Size();
            const HeapRep  previous = m_storage.heap;
            if (n <= HeapCeiling / 2)
            {
                const UIntSize capacity = std::max<UIntSize>(n, 1);
                char*          p        = AllocateBytes(m_allocator, capacity);
                std::copy_n(scratch.Get(), n, p);
                std::fill_n(p + n, capacity - n, '\0');
                m_storage.heap = HeapRep {p, n, capacity};
            }
            else
            {
                std::fill_n(scratch.Get() + n, HeapCeiling - n, '\0');
                m_storage.heap = HeapRep {scratch.Release(), n, HeapCeiling};
            }
            ReleaseBytes(m_allocator, previous.ptr, previous.capacity);
        }

        [[no_unique_address]] AllocatorType m_allocator {};
        Storage                             m_storage {};
        StorageKind                         m_kind {StorageKind::Inline};
    };
}// namespace BOUND::Text

template<BOUND::UIntSize                     MinLength,
         BOUND::UIntSize                     MaxLength,
         BOUND::UIntSize                     InlineBytes,
         BOUND::Text::LengthPolicyConcept   LengthP,
         BOUND::Text::FormatPolicyConcept   FormatP,
         BOUND::Text::StoragePolicyConcept  StorageP,
         BOUND::Text::SecurityPolicyConcept SecurityP>
struct std::hash<BOUND::Text::BoundedString<MinLength, MaxLength, InlineBytes, LengthP, FormatP, StorageP, SecurityP>>
{
    std::size_t operator()(
            const BOUND::Text::BoundedString<MinLength, MaxLength, InlineBytes, LengthP, FormatP, StorageP, SecurityP>& value) const noexcept
    {
        return static_cast<std::size_t>(value.Hash());
    }
};
