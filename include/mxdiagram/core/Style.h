#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace mxdiagram {

/// Flat key/value property bag controlling how the editor renders a cell
///
/// On the wire a style is a single attribute string `key=value;flag;...`.
/// Entries with an empty value are written as bare `flag;`.
///
/// Neither `;` nor `=` is escaped: the editor's own parser uses the same
/// unescaped convention, so a key or value containing either character
/// cannot be decoded back faithfully.
///
/// Iteration (and therefore encode) order is unspecified.
class Style {
public:
    using Map = std::unordered_map<std::string, std::string>;
    using const_iterator = Map::const_iterator;

    Style() = default;
    Style(std::initializer_list<std::pair<const std::string, std::string>> entries)
        : attributes_(entries) {}
    explicit Style(Map attributes) : attributes_(std::move(attributes)) {}

    /// Set (or overwrite) an entry. An empty value makes it a flag.
    Style& set(const std::string& key, const std::string& value = "");

    /// Value for key, or nullopt if the key is absent
    std::optional<std::string> get(const std::string& key) const;

    bool contains(const std::string& key) const;
    bool erase(const std::string& key);
    void clear() { attributes_.clear(); }

    size_t size() const { return attributes_.size(); }
    bool empty() const { return attributes_.empty(); }

    const Map& attributes() const { return attributes_; }
    const_iterator begin() const { return attributes_.begin(); }
    const_iterator end() const { return attributes_.end(); }

    /// Render as `key=value;` / `key;` per entry. Empty style gives "".
    std::string encode() const;

    /// Parse a style attribute string. Never fails.
    ///
    /// The input is split on every `;` and each fragment becomes an entry:
    /// text before the first `=` is the key, the rest is the value (empty
    /// when there is no `=`). Duplicate keys keep the last value.
    /// A trailing `;` (and the empty string itself) therefore yields an
    /// entry with an empty key and empty value; callers that care can
    /// erase("") it.
    static Style decode(const std::string& text);

    bool operator==(const Style& o) const { return attributes_ == o.attributes_; }
    bool operator!=(const Style& o) const { return !(*this == o); }

private:
    Map attributes_;
};

}  // namespace mxdiagram
