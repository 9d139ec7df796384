#include <BOUND/Text/BoundedStringError.hpp>

#include <string>

namespace BOUND::Text
{
    namespace
    {
        class BoundedStringCategoryImpl final : public std::error_category
        {
        public:
            const char* name() const noexcept override { return "BOUND.BoundedString"; }

            std::string message(int value) const override
            {
                switch (static_cast<BoundedStringError>(value - 1))
                {
                    case BoundedStringError::TooShort:
                        return "logical length is below the minimum";
                    case BoundedStringError::TooLong:
                        return "logical length is above the maximum";
                    case BoundedStringError::TooManyBytes:
                        return "byte length exceeds the available capacity";
                    case BoundedStringError::InvalidContent:
                        return "text is ill-formed UTF-8 or rejected by the format policy";
                    case BoundedStringError::MutationFailed:
                        return "mutation produced an invalid value";
                }
                return "unknown bounded string error";
            }

            std::error_condition default_error_condition(int value) const noexcept override
            {
                switch (static_cast<BoundedStringError>(value - 1))
                {
                    case BoundedStringError::TooManyBytes:
                        return std::errc::value_too_large;
                    case BoundedStringError::TooShort:
                    case BoundedStringError::TooLong:
                    case BoundedStringError::InvalidContent:
                    case BoundedStringError::MutationFailed:
                        return std::errc::invalid_argument;
                }
                return std::error_condition(value, *this);
            }
        };
    }// namespace

    const std::error_category& BoundedStringCategory() noexcept
    {
        static const BoundedStringCategoryImpl category;
        return category;
    }
}// namespace BOUND::Text
