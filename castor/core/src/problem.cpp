#include "castor/core/problem.hpp"

#include "castor/core/json.hpp"

namespace castor {

value problem_details::to_value() const {
    object_t body;
    body.members.emplace_back("type", type);
    body.members.emplace_back("title", title);
    body.members.emplace_back("status", status);
    if (detail) {
        body.members.emplace_back("detail", *detail);
    }
    if (instance) {
        body.members.emplace_back("instance", *instance);
    }
    for (const auto& [key, ext] : extensions) {
        body.set(key, ext);
    }
    return value(std::move(body));
}

std::string problem_details::to_json() const {
    return castor::to_json(to_value());
}

problem_details problem_details::bad_request(std::string_view detail) {
    problem_details p;
    p.status = 400;
    p.title = "Bad Request";
    if (!detail.empty()) {
        p.detail = std::string(detail);
    }
    return p;
}

problem_details problem_details::unprocessable_entity(std::string_view detail) {
    problem_details p;
    p.status = 422;
    p.title = "Unprocessable Entity";
    if (!detail.empty()) {
        p.detail = std::string(detail);
    }
    return p;
}

problem_details problem_details::unprocessable_entity(const cast_errors& errors) {
    problem_details p = unprocessable_entity(std::string_view{});
    value rendered = render_errors(errors);
    if (const value* list = rendered.find("errors")) {
        p.extensions.emplace("errors", *list);
    }
    return p;
}

} // namespace castor
