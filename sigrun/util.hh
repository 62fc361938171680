#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sigrun {

// Escape a dynamic value to protect against XSS and malformed HTML
std::string escape(std::string_view s);

// Decode the character references produced by escape() and numeric
// character references. Unknown named references are left as is.
std::string unescape(std::string_view s);

// Append-only string builder for HTML output. Data is written into chunks of
// growing capacity, so written data is never moved on growth.
class Rope {
public:
    Rope() { chunks.emplace_back().reserve(first_chunk); }

    Rope& operator<<(std::string_view s)
    {
        write(s.data(), s.size());
        return *this;
    }

    Rope& operator<<(const std::string& s)
    {
        write(s.data(), s.size());
        return *this;
    }

    Rope& operator<<(const char* s) { return *this << std::string_view(s); }

    Rope& operator<<(char c)
    {
        write(&c, 1);
        return *this;
    }

    // Numbers are written in decimal
    template <class T,
        class = std::enable_if_t<std::is_arithmetic<T>::value>>
    Rope& operator<<(T n)
    {
        return *this << std::to_string(n);
    }

    // Total length of all written data
    size_t size() const { return _size; }

    // Concatenate all chunks
    std::string str() const;

private:
    static constexpr size_t first_chunk = 1 << 10;

    std::vector<std::string> chunks;
    size_t _size = 0;

    void write(const char* data, size_t n);
};

// Returns, if the string contains only ASCII whitespace
bool is_blank(std::string_view s);

// Convert ASCII string to lowercase
std::string to_lower(std::string_view s);

// Split s on any run of ASCII whitespace, dropping empty fragments
std::vector<std::string> split_words(std::string_view s);
}
