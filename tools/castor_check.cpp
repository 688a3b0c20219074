#include "castor/core/cast.hpp"
#include "castor/core/json.hpp"
#include "castor/core/openapi_loader.hpp"
#include "castor/core/yaml.hpp"
#include "castor_check/options.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

using castor::error_code;
using castor::value;
using castor::openapi::document;
using namespace castor_check;

namespace {

std::string error_message(const std::error_code& ec) {
    switch (static_cast<error_code>(ec.value())) {
    case error_code::openapi_parse_error:
        return "failed to parse OpenAPI document";
    case error_code::openapi_invalid_spec:
        return "invalid or unsupported OpenAPI document (expected 3.x)";
    default:
        return ec.message();
    }
}

std::optional<document> load(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[check] input spec is required\n";
        return std::nullopt;
    }
    auto loaded = castor::openapi::load_from_file(opts.input.c_str());
    if (!loaded) {
        std::cerr << "[check] " << error_message(loaded.error()) << "\n";
        return std::nullopt;
    }
    return std::move(*loaded);
}

castor::cast_options cast_options_for(const options& opts) {
    castor::cast_options co;
    co.context = opts.parameter ? castor::cast_context::parameter : castor::cast_context::body;
    co.direction =
        opts.response ? castor::cast_direction::response : castor::cast_direction::request;
    return co;
}

void print_errors(const castor::cast_errors& errors, bool json_output) {
    if (json_output) {
        std::cout << castor::render_errors(errors) << "\n";
        return;
    }
    for (const auto& e : errors) {
        std::cout << "[check] " << e.pointer() << ": " << e.message() << " ("
                  << castor::cast_error_kind_name(e.kind) << ")\n";
    }
}

std::optional<value> read_value(const options& opts) {
    std::string text = opts.value_text;
    if (!opts.value_file.empty()) {
        std::ifstream in(opts.value_file, std::ios::binary);
        if (!in) {
            std::cerr << "[check] cannot open " << opts.value_file << "\n";
            return std::nullopt;
        }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } else if (opts.parameter) {
        return value(text);
    }
    std::string parse_message;
    auto parsed = castor::parse_document(text, &parse_message);
    if (!parsed) {
        std::cerr << "[check] value is not valid JSON/YAML: " << parse_message << "\n";
        return std::nullopt;
    }
    return std::move(*parsed);
}

int run_validate(const options& opts) {
    if (opts.schema.empty() || (opts.value_text.empty() && opts.value_file.empty())) {
        std::cerr << "[check] validate needs --schema and --value or --value-file\n";
        return 1;
    }
    auto doc = load(opts);
    if (!doc) {
        return 1;
    }
    auto input = read_value(opts);
    if (!input) {
        return 1;
    }

    const auto* target = doc->schemas.resolve(opts.schema);
    if (!target) {
        std::cerr << "[check] unknown schema: " << opts.schema << "\n";
        return 1;
    }
    auto typed = castor::cast(*input, *target, doc->schemas, cast_options_for(opts));
    if (!typed) {
        print_errors(typed.error(), opts.json_output);
        return 1;
    }
    if (opts.json_output) {
        std::cout << *typed << "\n";
    } else {
        std::cout << "[check] OK: " << *typed << "\n";
    }
    return 0;
}

int report_examples(const document& doc, const options& opts) {
    auto failures = castor::check_examples(doc.schemas, cast_options_for(opts));
    for (const auto& failure : failures) {
        if (opts.json_output) {
            std::cout << castor::to_json(value::object({
                             {"schema", failure.schema_name},
                             {"errors", castor::render_errors(failure.errors)},
                         }))
                      << "\n";
            continue;
        }
        std::cout << "[check] example of " << failure.schema_name << " does not cast:\n";
        print_errors(failure.errors, false);
    }
    return failures.empty() ? 0 : 1;
}

int run_examples(const options& opts) {
    auto doc = load(opts);
    if (!doc) {
        return 1;
    }
    const int rc = report_examples(*doc, opts);
    if (rc == 0 && !opts.json_output) {
        std::cout << "[check] OK: all examples cast\n";
    }
    return rc;
}

int run_check(const options& opts) {
    auto doc = load(opts);
    if (!doc) {
        return 1;
    }
    if (opts.json_output) {
        castor::array_t names;
        for (const auto* s : doc->schemas.named()) {
            names.emplace_back(s->name);
        }
        std::cout << castor::to_json(value::object({
                         {"openapi", doc->openapi_version},
                         {"title", doc->info_title},
                         {"version", doc->info_version},
                         {"schemas", value(std::move(names))},
                     }))
                  << "\n";
    } else {
        std::cout << "[check] OK: version=" << doc->openapi_version
                  << ", title=" << doc->info_title << ", schemas=" << doc->schemas.size() << "\n";
    }
    if (opts.strict) {
        return report_examples(*doc, opts);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand == "validate") {
        return run_validate(opts);
    }
    if (opts.subcommand == "examples") {
        return run_examples(opts);
    }
    if (opts.subcommand == "check") {
        return run_check(opts);
    }
    std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
    print_usage();
}
