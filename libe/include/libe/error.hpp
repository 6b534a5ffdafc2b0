#pragma once

namespace elib {

struct ErrorCategory {
    const char* name;
};

class Error {
public:
    constexpr Error(int code, const ErrorCategory* category, const char* description = "") :
        code(code), category(category), _description(description) {}

    constexpr Error(const Error& error) = default;

    constexpr Error& operator=(const Error& error) = default;

    constexpr bool operator==(const Error& other) const {
        return code == other.code && category == other.category;
    }

    constexpr const char* description() const {
        return _description;
    }

    constexpr const char* categoryName() const {
        return category->name;
    }

private:
    int code;
    const ErrorCategory* category;
    const char* _description;
};

struct CommonCategory : ErrorCategory {};
inline constexpr auto commonCategory = CommonCategory{{"common"}};

inline constexpr auto InvalidArgument = Error{-1, &commonCategory, "invalid argument"};

} // namespace elib
