#pragma once

#include "cast_error.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace castor {

// RFC 7807 body for rejected payloads.
struct problem_details {
    std::string type = "about:blank";
    std::string title;
    int status = 500;
    std::optional<std::string> detail;
    std::optional<std::string> instance;
    std::map<std::string, value> extensions;

    problem_details() = default;
    problem_details(problem_details&&) noexcept = default;
    problem_details& operator=(problem_details&&) noexcept = default;
    problem_details(const problem_details&) = default;
    problem_details& operator=(const problem_details&) = default;

    [[nodiscard]] value to_value() const;
    [[nodiscard]] std::string to_json() const;

    // Body that is not parseable JSON.
    static problem_details bad_request(std::string_view detail = "");
    static problem_details unprocessable_entity(std::string_view detail = "");
    // Cast failures, listed under the "errors" extension member.
    static problem_details unprocessable_entity(const cast_errors& errors);
};

} // namespace castor
