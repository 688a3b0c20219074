#pragma once

#include "schema.hpp"

#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace castor::openapi {

// Name -> schema table for one API document. Owns every schema node (named
// and inline) so child pointers stay valid for the registry's lifetime.
// Built once, then shared read-only; concurrent reads need no locking.
class registry {
public:
    registry() = default;
    registry(registry&&) = default;
    registry& operator=(registry&&) = default;
    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;

    // nullptr when `name` is already registered.
    schema* add_schema(std::string name);
    schema& add_inline_schema();

    [[nodiscard]] const schema* resolve(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return resolve(name) != nullptr;
    }

    // Named schemas in registration order.
    [[nodiscard]] const std::vector<const schema*>& named() const noexcept { return order_; }
    [[nodiscard]] size_t size() const noexcept { return order_.size(); }

private:
    struct name_hash {
        using is_transparent = void;

        [[nodiscard]] size_t operator()(std::string_view sv) const noexcept {
            size_t hash = 14695981039346656037ULL;
            for (char c : sv) {
                hash ^= static_cast<unsigned char>(c);
                hash *= 1099511628211ULL;
            }
            return hash;
        }
    };

    std::deque<schema> nodes_;
    std::unordered_map<std::string, const schema*, name_hash, std::equal_to<>> index_;
    std::vector<const schema*> order_;
};

} // namespace castor::openapi
