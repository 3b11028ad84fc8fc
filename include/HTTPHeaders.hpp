#ifndef HTTP_HEADERS_HPP
#define HTTP_HEADERS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * HTTPHeaders - Ordered HTTP header fields with case-insensitive lookup
 *
 * Serialization keeps insertion order; set() replaces every existing
 * field of the same name in place of the first one.
 */
class HTTPHeaders {
public:
    using Field = std::pair<std::string, std::string>;

    /**
     * Insert or replace a header
     *
     * @param name Header name (case-insensitive for replacement)
     * @param value Header value
     */
    void set(std::string_view name, std::string_view value);

    /** Append a field, keeping existing ones of the same name */
    void add(std::string_view name, std::string_view value);

    /** @return true if at least one field was removed */
    bool remove(std::string_view name);

    /** @return First value for name, or empty string if not found */
    std::string get(std::string_view name) const;

    bool has(std::string_view name) const;

    const std::vector<Field>& fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }

    /** "Name: value\r\n" for every field, without the terminating blank line */
    std::string serialize() const;

private:
    std::vector<Field> fields_;
};

#endif // HTTP_HEADERS_HPP
