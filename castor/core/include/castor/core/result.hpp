#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace castor {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    json_parse_error = 1,
    yaml_parse_error = 2,
    openapi_parse_error = 3,
    openapi_invalid_spec = 4,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "castor"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::json_parse_error:
            return "malformed JSON text";
        case ec::yaml_parse_error:
            return "malformed YAML text";
        case ec::openapi_parse_error:
            return "failed to parse OpenAPI document";
        case ec::openapi_invalid_spec:
            return "invalid or unsupported OpenAPI document";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace castor

namespace std {
template <> struct is_error_code_enum<castor::error_code> : true_type {};
} // namespace std
