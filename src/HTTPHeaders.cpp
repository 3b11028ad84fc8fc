#include "HTTPHeaders.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <iterator>

using namespace utils;

void HTTPHeaders::set(std::string_view name, std::string_view value) {
    auto first = std::find_if(fields_.begin(), fields_.end(),
                              [&](const Field& f) { return equalsIgnoreCase(f.first, name); });
    if (first == fields_.end()) {
        add(name, value);
        return;
    }

    // Replace the first occurrence, drop the rest
    first->second = std::string{value};
    auto next = std::next(first);
    fields_.erase(std::remove_if(next, fields_.end(),
                                 [&](const Field& f) { return equalsIgnoreCase(f.first, name); }),
                  fields_.end());
}

void HTTPHeaders::add(std::string_view name, std::string_view value) {
    fields_.emplace_back(std::string{name}, std::string{value});
}

bool HTTPHeaders::remove(std::string_view name) {
    auto before = fields_.size();
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&](const Field& f) { return equalsIgnoreCase(f.first, name); }),
                  fields_.end());
    return fields_.size() != before;
}

std::string HTTPHeaders::get(std::string_view name) const {
    for (const auto& [key, value] : fields_) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return "";
}

bool HTTPHeaders::has(std::string_view name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&](const Field& f) { return equalsIgnoreCase(f.first, name); });
}

std::string HTTPHeaders::serialize() const {
    std::string out;
    for (const auto& [key, value] : fields_) {
        out.append(key).append(": ").append(value).append("\r\n");
    }
    return out;
}
