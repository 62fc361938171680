#include "util.hh"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace sigrun {

void Rope::write(const char* data, size_t n)
{
    auto* last = &chunks.back();
    if (last->size() + n > last->capacity()) {
        const auto cap = std::max(last->capacity() << 1, n);
        last = &chunks.emplace_back();
        last->reserve(cap);
    }
    last->append(data, n);
    _size += n;
}

std::string Rope::str() const
{
    std::string out;
    out.reserve(_size);
    for (auto& c : chunks) {
        out += c;
    }
    return out;
}

// Returns the character reference for a character, that must be escaped, or
// nullptr. Numeric references for quotes are shorter than the named ones.
static const char* reference(char ch)
{
    switch (ch) {
    case '&':
        return "&amp;";
    case '<':
        return "&lt;";
    case '>':
        return "&gt;";
    case '"':
        return "&#34;";
    case '\'':
        return "&#39;";
    default:
        return nullptr;
    }
}

std::string escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + s.size() / 8);
    size_t done = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if (auto ref = reference(s[i])) {
            out.append(s.data() + done, i - done);
            out += ref;
            done = i + 1;
        }
    }
    out.append(s.data() + done, s.size() - done);
    return out;
}

// Write a code point as UTF-8
static void write_utf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80) {
        out += char(cp);
    } else if (cp < 0x800) {
        out += char(0xC0 | (cp >> 6));
        out += char(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += char(0xE0 | (cp >> 12));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    } else {
        out += char(0xF0 | (cp >> 18));
        out += char(0x80 | ((cp >> 12) & 0x3F));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }
}

// Parse a numeric character reference body like "#39" or "#x27".
// Returns 0 on failure.
static uint32_t parse_numeric_ref(std::string_view ref)
{
    int base = 10;
    ref.remove_prefix(1);
    if (!ref.empty() && (ref[0] == 'x' || ref[0] == 'X')) {
        base = 16;
        ref.remove_prefix(1);
    }
    if (ref.empty() || ref.size() > 8) {
        return 0;
    }

    uint32_t cp = 0;
    for (auto ch : ref) {
        int digit;
        if (ch >= '0' && ch <= '9') {
            digit = ch - '0';
        } else if (base == 16 && ch >= 'a' && ch <= 'f') {
            digit = ch - 'a' + 10;
        } else if (base == 16 && ch >= 'A' && ch <= 'F') {
            digit = ch - 'A' + 10;
        } else {
            return 0;
        }
        cp = cp * base + digit;
    }
    if (cp > 0x10FFFF) {
        return 0;
    }
    return cp;
}

std::string unescape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const auto amp = s.find('&', i);
        if (amp == std::string_view::npos) {
            out += s.substr(i);
            break;
        }
        out += s.substr(i, amp - i);

        const auto semi = s.find(';', amp);
        // Longest reference we decode is "&#x10FFFF;"
        if (semi == std::string_view::npos || semi - amp > 10) {
            out += '&';
            i = amp + 1;
            continue;
        }

        const auto ref = s.substr(amp + 1, semi - amp - 1);
        if (ref == "amp") {
            out += '&';
        } else if (ref == "lt") {
            out += '<';
        } else if (ref == "gt") {
            out += '>';
        } else if (ref == "quot") {
            out += '"';
        } else if (ref == "apos") {
            out += '\'';
        } else if (ref == "nbsp") {
            write_utf8(out, 0xA0);
        } else if (!ref.empty() && ref[0] == '#') {
            const auto cp = parse_numeric_ref(ref);
            if (!cp) {
                out += s.substr(amp, semi - amp + 1);
            } else {
                write_utf8(out, cp);
            }
        } else {
            out += s.substr(amp, semi - amp + 1);
        }
        i = semi + 1;
    }
    return out;
}

bool is_blank(std::string_view s)
{
    for (auto ch : s) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::string to_lower(std::string_view s)
{
    std::string conv;
    conv.reserve(s.size());
    for (auto ch : s) {
        conv += std::tolower(static_cast<unsigned char>(ch));
    }
    return conv;
}

std::vector<std::string> split_words(std::string_view s)
{
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
            i++;
        }
        const auto start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
            i++;
        }
        if (i > start) {
            words.emplace_back(s.substr(start, i - start));
        }
    }
    return words;
}
}
