#include "castor/core/registry.hpp"

namespace castor::openapi {

schema* registry::add_schema(std::string name) {
    if (index_.contains(name)) {
        return nullptr;
    }
    schema& s = nodes_.emplace_back();
    s.name = name;
    index_.emplace(std::move(name), &s);
    order_.push_back(&s);
    return &s;
}

schema& registry::add_inline_schema() {
    return nodes_.emplace_back();
}

const schema* registry::resolve(std::string_view name) const noexcept {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

} // namespace castor::openapi
