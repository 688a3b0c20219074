#include "castor/core/cast.hpp"
#include "castor/core/json.hpp"
#include "castor/core/openapi_loader.hpp"
#include "castor/core/problem.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace castor;

constexpr std::string_view API_SPEC = R"(openapi: 3.0.3
info:
  title: Users API
  version: 1.0.0
components:
  schemas:
    UserId:
      type: integer
      format: int32
      minimum: 1
    CreateUser:
      type: object
      x-struct: CreateUser
      required: [name, email, birthday]
      additionalProperties: false
      properties:
        id:
          type: integer
          readOnly: true
        name:
          type: string
          minLength: 1
        email:
          type: string
          format: email
        birthday:
          type: string
          format: date
        role:
          type: string
          enum: [admin, member]
          default: member
)";

struct http_reply {
    int status;
    std::string body;
};

// What an HTTP layer does with a JSON request body for one operation.
http_reply handle_body(std::string_view body,
                       const openapi::schema& target,
                       const openapi::registry& reg) {
    auto parsed = parse_json(body);
    if (!parsed) {
        auto problem = problem_details::bad_request("request body is not valid JSON");
        return {problem.status, problem.to_json()};
    }
    auto typed = cast(*parsed, target, reg);
    if (!typed) {
        auto problem = problem_details::unprocessable_entity(typed.error());
        return {problem.status, problem.to_json()};
    }
    return {201, to_json(*typed)};
}

// Same for one path parameter; the raw text may be coerced to the schema type.
http_reply handle_path_id(std::string_view raw,
                          const openapi::schema& target,
                          const openapi::registry& reg) {
    cast_options opts;
    opts.context = cast_context::parameter;
    json_pointer path{std::string("id")};
    auto typed = cast(value(raw), target, reg, path, opts);
    if (!typed) {
        auto problem = problem_details::unprocessable_entity(typed.error());
        return {problem.status, problem.to_json()};
    }
    return {200, to_json(*typed)};
}

int main() {
    auto doc = openapi::load_from_string(API_SPEC);
    if (!doc) {
        std::cerr << "failed to load API document: " << doc.error().message() << "\n";
        return 1;
    }
    const auto& reg = doc->schemas;
    const auto* create_user = reg.resolve("CreateUser");
    const auto* user_id = reg.resolve("UserId");
    if (!create_user || !user_id) {
        std::cerr << "API document is missing schemas\n";
        return 1;
    }

    const std::string_view bodies[] = {
        R"({"name": "Ada", "email": "ada@example.com", "birthday": "1815-12-10"})",
        R"({"name": "", "email": "ada", "birthday": "1815-02-30", "admin": true})",
        R"({"name": "Ada", )",
    };
    for (auto body : bodies) {
        auto reply = handle_body(body, *create_user, reg);
        std::cout << "POST /users " << body << "\n  -> " << reply.status << " " << reply.body
                  << "\n";
    }

    for (std::string_view raw : {"42", "0", "forty-two"}) {
        auto reply = handle_path_id(raw, *user_id, reg);
        std::cout << "GET /users/" << raw << "\n  -> " << reply.status << " " << reply.body
                  << "\n";
    }
    return 0;
}
