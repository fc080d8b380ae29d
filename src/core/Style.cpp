#include "mxdiagram/core/Style.h"

namespace mxdiagram {

Style& Style::set(const std::string& key, const std::string& value) {
    attributes_[key] = value;
    return *this;
}

std::optional<std::string> Style::get(const std::string& key) const {
    auto it = attributes_.find(key);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Style::contains(const std::string& key) const {
    return attributes_.find(key) != attributes_.end();
}

bool Style::erase(const std::string& key) {
    return attributes_.erase(key) > 0;
}

std::string Style::encode() const {
    std::string text;
    for (const auto& [key, value] : attributes_) {
        text += key;
        if (!value.empty()) {
            text += '=';
            text += value;
        }
        text += ';';
    }
    return text;
}

Style Style::decode(const std::string& text) {
    Style style;

    size_t start = 0;
    while (true) {
        size_t end = text.find(';', start);
        std::string pair = text.substr(start, end == std::string::npos ? std::string::npos : end - start);

        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            style.attributes_[pair] = "";
        } else {
            style.attributes_[pair.substr(0, eq)] = pair.substr(eq + 1);
        }

        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return style;
}

}  // namespace mxdiagram
