/// @file BoundedStringTests.cpp
/// @brief Tests for BoundedString construction, mutation, storage and comparison.

#include <BOUND/Memory/AuditingAllocator.hpp>
#include <BOUND/Text/BoundedString.hpp>

#include <catch2/catch_test_macros.hpp>

#include <new>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

using namespace BOUND::Text;

namespace
{
    using Username = BoundedString<3, 16, 16, Scalars, AsciiOnly>;
    using Token    = BoundedString<1, 128, 128, Scalars, AllOf<AsciiAlphanumeric, MaxBytes<128>>>;
    using Fixed5   = BoundedString<1, 5, 5, Bytes>;
    using Glyphs   = BoundedString<1, 10, 20, Scalars>;
    using Body     = BoundedString<0, 256, 8, Bytes, AllowAll, HeapAllowed<>>;
    using Secret   = BoundedString<1, 32, 32, Bytes, AllowAll, StackOnly, SecretSecurity>;

    using AuditedAlloc = BOUND::Memory::Auditing<>;
    using SecretHeap   = BoundedString<1, 100, 10, Bytes, AllowAll, HeapAllowed<AuditedAlloc>, SecretSecurity>;
    using PlainHeap    = BoundedString<1, 100, 10, Bytes, AllowAll, HeapAllowed<AuditedAlloc>>;
    using WideHeap     = BoundedString<1, 4096, 16, Scalars, AllowAll, HeapAllowed<AuditedAlloc>>;
    using HeapOnly     = BoundedString<1, 100, 0, Bytes, AllowAll, HeapAllowed<>>;

    struct MutatorFailure : std::runtime_error
    {
        MutatorFailure()
            : std::runtime_error("mutator failure")
        {
        }
    };
}// namespace

// Validation is constant-evaluable and agrees with the runtime path.
static_assert(Username::Validate("Alice123").has_value());
static_assert(Username::Validate("Al").error() == BoundedStringError::TooShort);
static_assert(Username::Validate("AAAAAAAAAAAAAAAAA").error() == BoundedStringError::TooLong);
static_assert(Username::Validate("Bob\xF0\x9F\x94\xA5").error() == BoundedStringError::InvalidContent);
static_assert(Fixed5::Validate("123456").error() == BoundedStringError::TooLong);
static_assert(Body::HeapCeiling == 256);
static_assert(Glyphs::HeapCeiling == 40);
static_assert(HeapOnly::InlineCapacity == 0);
static_assert(HeapOnly::HeapCeiling == 100);

TEST_CASE("BoundedString accepts text inside its bounds", "[Text][BoundedString]")
{
    auto user = Username::Create("Alice123");
    REQUIRE(user.has_value());
    CHECK(user->View() == "Alice123");
    CHECK(user->ByteLength() == 8);
    CHECK(user->LogicalLength() == 8);
    CHECK(user->LogicalLength() == user->LogicalLength());
    CHECK(user->IsInline());
    CHECK(user->GetStorageKind() == StorageKind::Inline);
    CHECK(user->Capacity() == 16);

    auto token = Token::Create("a1b2c3d4e5");
    REQUIRE(token.has_value());
    CHECK(*token == "a1b2c3d4e5");
}

TEST_CASE("BoundedString rejects text outside its bounds", "[Text][BoundedString]")
{
    SECTION("Too short")
    {
        auto user = Username::Create("Al");
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error() == BoundedStringError::TooShort);
    }
    SECTION("Too long")
    {
        auto user = Username::Create(std::string(17, 'A'));
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error() == BoundedStringError::TooLong);
    }
    SECTION("Non-ASCII content")
    {
        auto user = Username::Create("Bob\xF0\x9F\x94\xA5");
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error() == BoundedStringError::InvalidContent);
    }
    SECTION("Token of 129 characters")
    {
        auto token = Token::Create(std::string(129, 'a'));
        REQUIRE_FALSE(token.has_value());
        CHECK(token.error() == BoundedStringError::TooLong);
    }
    SECTION("Token with emoji")
    {
        auto token = Token::Create("\xF0\x9F\x94\xA5\xF0\x9F\x94\xA5\xF0\x9F\x94\xA5");
        REQUIRE_FALSE(token.has_value());
        CHECK(token.error() == BoundedStringError::InvalidContent);
    }
    SECTION("Ill-formed UTF-8")
    {
        auto glyphs = Glyphs::Create("ab\xC3");
        REQUIRE_FALSE(glyphs.has_value());
        CHECK(glyphs.error() == BoundedStringError::InvalidContent);
    }
}

TEST_CASE("BoundedString counts scalars or bytes per length policy", "[Text][BoundedString]")
{
    // Four scalars, ten bytes
    const std::string text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x94\xA5";

    auto glyphs = Glyphs::Create(text);
    REQUIRE(glyphs.has_value());
    CHECK(glyphs->LogicalLength() == 4);
    CHECK(glyphs->ByteLength() == 10);

    using ByteBound = BoundedString<1, 8, 16, Bytes>;
    auto bytes      = ByteBound::Create(text);
    REQUIRE_FALSE(bytes.has_value());
    CHECK(bytes.error() == BoundedStringError::TooLong);
}

TEST_CASE("BoundedString literals are checked at compile time", "[Text][BoundedString]")
{
    const Username user {"alice"};
    CHECK(user.View() == "alice");

    constexpr Username::Literal literal {"bob_99"};
    const Username              other(literal);
    CHECK(other == "bob_99");

    // Same answer at compile time and at runtime.
    constexpr bool compileTime = Username::Validate("carol").has_value();
    CHECK(compileTime == Username::Create("carol").has_value());
}

TEST_CASE("BoundedString promotes to the heap only when allowed", "[Text][BoundedString]")
{
    SECTION("Inline capacity fits inline")
    {
        auto body = Body::Create(std::string(8, 'x'));
        REQUIRE(body.has_value());
        CHECK(body->IsInline());
    }
    SECTION("One past inline capacity goes to the heap")
    {
        auto body = Body::Create(std::string(9, 'x'));
        REQUIRE(body.has_value());
        CHECK(body->IsHeap());
        CHECK(body->ByteLength() == 9);
        CHECK(body->View() == std::string(9, 'x'));
    }
    SECTION("Stack-only storage refuses the same size")
    {
        auto fixed = Fixed5::Create("12345");
        REQUIRE(fixed.has_value());
        CHECK(fixed->IsInline());

        using Narrow = BoundedString<1, 16, 4, Bytes>;
        auto narrow  = Narrow::Create("12345");
        REQUIRE_FALSE(narrow.has_value());
        CHECK(narrow.error() == BoundedStringError::TooManyBytes);
    }
    SECTION("Zero inline bytes sends every text to the heap")
    {
        auto value = HeapOnly::Create("A");
        REQUIRE(value.has_value());
        CHECK(value->IsHeap());
        CHECK(*value == "A");

        REQUIRE(value->Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'B'; }).has_value());
        CHECK(value->IsHeap());
        CHECK(*value == "B");

        auto empty = HeapOnly::Create("");
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error() == BoundedStringError::TooShort);

        using MaybeEmpty = BoundedString<0, 8, 0, Bytes, AllowAll, HeapAllowed<>>;
        auto nothing     = MaybeEmpty::Create("");
        REQUIRE(nothing.has_value());
        CHECK(nothing->IsInline());
        CHECK(nothing->Capacity() == 0);
    }
    SECTION("Maximum length on the heap")
    {
        auto body = Body::Create(std::string(256, 'B'));
        REQUIRE(body.has_value());
        CHECK(body->ByteLength() == 256);

        auto over = Body::Create(std::string(257, 'C'));
        REQUIRE_FALSE(over.has_value());
        CHECK(over.error() == BoundedStringError::TooLong);
    }
}

TEST_CASE("BoundedString mutation commits valid results", "[Text][BoundedString][Mutate]")
{
    SECTION("Inline mutation returns the mutator result")
    {
        auto value = Username::Create("Alice").value();
        auto result = value.Mutate([](MutableBytes& bytes) {
            bytes.Data()[0] = 'J';
            return 42;
        });
        REQUIRE(result.has_value());
        CHECK(*result == 42);
        CHECK(value == "Jlice");
    }
    SECTION("Inline mutation may change the size")
    {
        auto value  = Username::Create("Alice").value();
        auto result = value.Mutate([](MutableBytes& bytes) {
            bytes.Data()[5] = '7';
            bytes.SetSize(6);
        });
        REQUIRE(result.has_value());
        CHECK(value == "Alice7");

        REQUIRE(value.Mutate([](MutableBytes& bytes) { bytes.SetSize(3); }).has_value());
        CHECK(value == "Ali");
        CHECK(value.ByteLength() == 3);
    }
    SECTION("Heap mutation")
    {
        auto body = Body::Create("Hello world, from the heap").value();
        REQUIRE(body.IsHeap());
        auto result = body.Mutate([](MutableBytes& bytes) {
            bytes.Data()[0] = 'J';
            return bytes.Capacity();
        });
        REQUIRE(result.has_value());
        CHECK(*result == Body::HeapCeiling);
        CHECK(body == "Jello world, from the heap");
    }
    SECTION("Heap value that shrinks stays on the heap")
    {
        auto body = Body::Create(std::string(20, 'z')).value();
        REQUIRE(body.IsHeap());
        REQUIRE(body.Mutate([](MutableBytes& bytes) { bytes.SetSize(2); }).has_value());
        CHECK(body.IsHeap());
        CHECK(body == "zz");
    }
}

TEST_CASE("BoundedString mutation never tears the live value", "[Text][BoundedString][Mutate]")
{
    SECTION("Reported size past capacity")
    {
        auto value  = Fixed5::Create("1234").value();
        auto result = value.Mutate([](MutableBytes& bytes) {
            for (BOUND::UIntSize i = 0; i < bytes.Capacity(); ++i)
                bytes.Data()[i] = 'A';
            bytes.SetSize(6);
        });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == BoundedStringError::TooManyBytes);
        CHECK(value == "1234");
    }
    SECTION("Heap reported size past ceiling")
    {
        auto value  = PlainHeap::Create("12345678901").value();
        REQUIRE(value.IsHeap());
        auto result = value.Mutate([](MutableBytes& bytes) { bytes.SetSize(200); });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == BoundedStringError::TooManyBytes);
        CHECK(value == "12345678901");
    }
    SECTION("Corrupted UTF-8 continuation byte")
    {
        auto value  = Glyphs::Create("\xF0\x9F\x94\xA5").value();
        auto result = value.Mutate([](MutableBytes& bytes) { bytes.Data()[1] = static_cast<char>(0xFF); });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == BoundedStringError::MutationFailed);
        CHECK(value == "\xF0\x9F\x94\xA5");
    }
    SECTION("Length below minimum")
    {
        auto value  = Username::Create("valid").value();
        auto result = value.Mutate([](MutableBytes& bytes) {
            bytes.Data()[0] = 'X';
            bytes.SetSize(1);
        });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == BoundedStringError::MutationFailed);
        CHECK(value == "valid");
    }
    SECTION("Format rejected")
    {
        auto value  = Token::Create("abc").value();
        auto result = value.Mutate([](MutableBytes& bytes) { bytes.Data()[1] = '-'; });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == BoundedStringError::MutationFailed);
        CHECK(value == "abc");
    }
    SECTION("Mutator throws")
    {
        auto value = Secret::Create("secret").value();
        CHECK_THROWS_AS(value.Mutate([](MutableBytes& bytes) {
            bytes.Data()[0] = 'X';
            throw MutatorFailure {};
        }),
                        MutatorFailure);
        CHECK(value == "secret");
    }
}

TEST_CASE("BoundedString secure erase wipes released heap blocks", "[Text][BoundedString][Security]")
{
    BOUND::Memory::AllocationAudit audit;
    AuditedAlloc                   alloc {audit};

    SECTION("Failed mutation scratch")
    {
        {
            auto created = SecretHeap::Create("long_secret_string", alloc);
            REQUIRE(created.has_value());
            auto& value = *created;
            REQUIRE(value.IsHeap());
            auto result = value.Mutate([](MutableBytes& bytes) {
                bytes.Data()[0] = 'Z';
                bytes.SetSize(0);
            });
            REQUIRE_FALSE(result.has_value());
            CHECK(value == "long_secret_string");
            CHECK(audit.wipedReleases == 1);
        }
        CHECK(audit.wipedReleases == 2);
        CHECK(audit.dirtyReleases == 0);
        CHECK(audit.currentCount == 0);
    }
    SECTION("Successful mutation releases the old block wiped")
    {
        {
            auto created = SecretHeap::Create("long_secret_string", alloc);
            REQUIRE(created.has_value());
            auto& value = *created;
            REQUIRE(value.Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'Z'; }).has_value());
            CHECK(value.View().substr(0, 1) == "Z");
            // The old block and the scratch the result was moved out of.
            CHECK(audit.wipedReleases == 2);
        }
        CHECK(audit.dirtyReleases == 0);
        CHECK(audit.currentBytes == 0);
    }
    SECTION("Mutator throws on a heap value")
    {
        auto created = SecretHeap::Create("long_secret_string", alloc);
        REQUIRE(created.has_value());
        auto& value = *created;
        REQUIRE(value.IsHeap());
        CHECK_THROWS_AS(value.Mutate([](MutableBytes& bytes) {
            bytes.Data()[0] = 'X';
            throw MutatorFailure {};
        }),
                        MutatorFailure);
        CHECK(value == "long_secret_string");
        CHECK(value.IsHeap());
        CHECK(audit.wipedReleases == 1);
        CHECK(audit.dirtyReleases == 0);
        CHECK(audit.currentCount == 1);
        CHECK(audit.currentBytes == 18);
    }
    SECTION("Without secure erase released blocks keep their bytes")
    {
        {
            auto created = PlainHeap::Create("long_plain_string", alloc);
            REQUIRE(created.has_value());
            CHECK(created->IsHeap());
        }
        CHECK(audit.dirtyReleases == 1);
        CHECK(audit.wipedReleases == 0);
    }
}

TEST_CASE("BoundedString stays unchanged when allocation fails", "[Text][BoundedString]")
{
    BOUND::Memory::AllocationAudit audit;
    AuditedAlloc                   alloc {audit};

    auto value = PlainHeap::Create("12345678901", alloc).value();
    audit.allocationsUntilFailure = 0;

    CHECK_THROWS_AS(value.Assign("a much longer heap string"), std::bad_alloc);
    CHECK(value == "12345678901");

    CHECK_THROWS_AS(value.Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'X'; }), std::bad_alloc);
    CHECK(value == "12345678901");
    CHECK(audit.failedCount == 2);

    // The scratch is granted but the exact-size block for the result is not.
    audit.allocationsUntilFailure = 1;
    CHECK_THROWS_AS(value.Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'X'; }), std::bad_alloc);
    CHECK(value == "12345678901");
    CHECK(audit.failedCount == 3);
    CHECK(audit.currentCount == 1);

    // Inline assignment needs no allocation.
    REQUIRE(value.Assign("short").has_value());
    CHECK(value.IsInline());
    CHECK(value == "short");
}

TEST_CASE("BoundedString heap mutation does not keep the scratch capacity", "[Text][BoundedString][Mutate]")
{
    BOUND::Memory::AllocationAudit audit;
    AuditedAlloc                   alloc {audit};

    SECTION("Short result moves into an exact-size block")
    {
        auto created = PlainHeap::Create("12345678901", alloc);
        REQUIRE(created.has_value());
        auto& value = *created;
        REQUIRE(value.IsHeap());

        for (int i = 0; i < 3; ++i)
            REQUIRE(value.Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'X'; }).has_value());
        CHECK(value == "X2345678901");
        CHECK(value.IsHeap());
        CHECK(value.Capacity() == 11);
        CHECK(audit.currentBytes == 11);
        CHECK(audit.currentCount == 1);
    }
    SECTION("Scalar ceiling is only held while the mutator runs")
    {
        auto created = WideHeap::Create(std::string(20, 'w'), alloc);
        REQUIRE(created.has_value());
        auto& value = *created;
        REQUIRE(value.IsHeap());
        CHECK(audit.currentBytes == 20);

        REQUIRE(value.Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'v'; }).has_value());
        CHECK(value.ByteLength() == 20);
        CHECK(audit.currentBytes == 20);
        CHECK(audit.peakBytes == 20 + WideHeap::HeapCeiling + 20);
    }
    SECTION("Result above half the ceiling keeps the scratch block")
    {
        auto created = PlainHeap::Create(std::string(60, 'p'), alloc);
        REQUIRE(created.has_value());
        auto& value = *created;

        REQUIRE(value.Mutate([](MutableBytes& bytes) { bytes.Data()[0] = 'q'; }).has_value());
        CHECK(value.Capacity() == PlainHeap::HeapCeiling);
        CHECK(audit.currentBytes == PlainHeap::HeapCeiling);
        CHECK(audit.currentCount == 1);
    }
}

TEST_CASE("BoundedString Assign validates before replacing", "[Text][BoundedString]")
{
    auto body = Body::Create("tiny").value();
    REQUIRE(body.Assign(std::string(40, 'q')).has_value());
    CHECK(body.IsHeap());
    CHECK(body.ByteLength() == 40);

    REQUIRE(body.Assign("tiny again").has_value());
    CHECK(body == "tiny again");

    auto user = Username::Create("Alice").value();
    auto bad  = user.Assign("Al");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error() == BoundedStringError::TooShort);
    CHECK(user == "Alice");

    // Self-assignment from our own view
    REQUIRE(user.Assign(user.View().substr(1)).has_value());
    CHECK(user == "lice");
}

TEST_CASE("BoundedString copies and moves keep both sides valid", "[Text][BoundedString]")
{
    auto original = Body::Create(std::string(30, 'm')).value();

    Body copy = original;
    CHECK(copy == original);
    CHECK(copy.IsHeap());
    CHECK(copy.Data() != original.Data());

    Body moved = std::move(original);
    CHECK(moved == std::string(30, 'm'));
    CHECK(original.ByteLength() == 30);// NOLINT(bugprone-use-after-move)

    auto other = Body::Create("inline").value();
    other      = std::move(moved);
    CHECK(other.IsHeap());
    CHECK(moved == "inline");// NOLINT(bugprone-use-after-move)

    swap(other, moved);
    CHECK(other == "inline");
    CHECK(moved.ByteLength() == 30);
}

TEST_CASE("BoundedString equality and hash ignore the representation", "[Text][BoundedString]")
{
    auto grown = Body::Create(std::string(20, 'h')).value();
    REQUIRE(grown.Mutate([](MutableBytes& bytes) { bytes.SetSize(4); }).has_value());
    REQUIRE(grown.IsHeap());

    auto small = Body::Create("hhhh").value();
    REQUIRE(small.IsInline());

    CHECK(grown == small);
    CHECK(grown.Hash() == small.Hash());
    CHECK(std::hash<Body> {}(grown) == std::hash<Body> {}(small));

    std::unordered_set<Body> set;
    set.insert(small);
    CHECK(set.contains(grown));
}

TEST_CASE("BoundedString ordering follows byte order", "[Text][BoundedString]")
{
    const auto alice = Username::Create("alice").value();
    const auto bob   = Username::Create("bob").value();

    CHECK(alice < bob);
    CHECK(bob > alice);
    CHECK((alice <=> alice) == std::strong_ordering::equal);
    CHECK(alice < std::string_view {"alicf"});
    CHECK(alice != bob);
}

TEST_CASE("BoundedString constant-time equality", "[Text][BoundedString][Security]")
{
    const auto s1 = Secret::Create("password123").value();
    const auto s2 = Secret::Create("password123").value();
    const auto s3 = Secret::Create("wrongpassword").value();
    const auto s4 = Secret::Create("pass").value();
    const auto s5 = Secret::Create("password124").value();

    CHECK(s1 == s2);
    CHECK(s1 != s3);
    CHECK(s1 != s4);
    CHECK(s1 != s5);
    CHECK(s1.ConstantTimeEquals(s2));
    CHECK_FALSE(s1.ConstantTimeEquals(s5));

    const auto h1 = SecretHeap::Create("a heap secret value").value();
    const auto h2 = SecretHeap::Create("a heap secret value").value();
    CHECK(h1 == h2);
}

TEST_CASE("BoundedStringError maps to error codes", "[Text][BoundedString]")
{
    const std::error_code code = BoundedStringError::TooManyBytes;
    CHECK(code.category() == BoundedStringCategory());
    CHECK(std::string(code.category().name()) == "BOUND.BoundedString");
    CHECK(code == std::errc::value_too_large);
    CHECK(MakeErrorCode(BoundedStringError::TooShort) == std::errc::invalid_argument);
    CHECK(ToString(BoundedStringError::MutationFailed) == "MutationFailed");
    CHECK_FALSE(code.message().empty());
}
