#include "parser.hh"
#include "util.hh"
#include <cctype>
#include <vector>

namespace sigrun {

static bool is_space(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch));
}

static bool is_name_start(char ch)
{
    return std::isalpha(static_cast<unsigned char>(ch));
}

// Tags, whose contents are text up to the closing tag
static bool is_text_content_tag(const std::string& tag)
{
    return tag == "script" || tag == "style" || tag == "textarea"
        || tag == "title";
}

// Builds a node tree from HTML source
class Parser {
public:
    Parser(std::string_view src)
        : src(src)
    {
        parents.push_back(&root);
    }

    Children parse()
    {
        while (pos < src.size()) {
            if (src[pos] == '<' && parse_markup()) {
                continue;
            }
            parse_text();
        }
        flush_text();
        return std::move(root.children);
    }

private:
    std::string_view src;
    size_t pos = 0;

    // Container of top level nodes
    Node root;

    // Currently open elements. Nodes are appended to the last one.
    std::vector<Node*> parents;

    // Pending raw text
    std::string buf;

    void flush_text()
    {
        if (buf.empty()) {
            return;
        }
        parents.back()->children.push_back(Node::text_node(unescape(buf)));
        buf.clear();
    }

    void append(Node n)
    {
        flush_text();
        parents.back()->children.push_back(std::move(n));
    }

    void parse_text()
    {
        // Consume at least one character, so that a stray '<' makes progress
        auto end = src.find('<', pos + 1);
        if (end == std::string_view::npos) {
            end = src.size();
        }
        buf += src.substr(pos, end - pos);
        pos = end;
    }

    // Parse markup starting at '<'. Returns false, if it is not markup and
    // should be treated as text.
    bool parse_markup()
    {
        const auto rest = src.substr(pos);
        if (rest.substr(0, 4) == "<!--") {
            parse_comment();
            return true;
        }
        if (rest.size() > 1 && (rest[1] == '!' || rest[1] == '?')) {
            // Doctype or processing instruction
            const auto end = src.find('>', pos);
            pos = end == std::string_view::npos ? src.size() : end + 1;
            return true;
        }
        if (rest.size() > 2 && rest[1] == '/' && is_name_start(rest[2])) {
            parse_closing_tag();
            return true;
        }
        if (rest.size() > 1 && is_name_start(rest[1])) {
            parse_opening_tag();
            return true;
        }
        return false;
    }

    void parse_comment()
    {
        const auto start = pos + 4;
        auto end = src.find("-->", start);
        if (end == std::string_view::npos) {
            append(Node::comment_node(std::string(src.substr(start))));
            pos = src.size();
            return;
        }
        append(Node::comment_node(std::string(src.substr(start, end - start))));
        pos = end + 3;
    }

    std::string read_name()
    {
        const auto start = pos;
        while (pos < src.size() && !is_space(src[pos]) && src[pos] != '>'
            && src[pos] != '/' && src[pos] != '=') {
            pos++;
        }
        return to_lower(src.substr(start, pos - start));
    }

    void skip_space()
    {
        while (pos < src.size() && is_space(src[pos])) {
            pos++;
        }
    }

    void parse_closing_tag()
    {
        pos += 2;
        const auto tag = read_name();
        const auto end = src.find('>', pos);
        pos = end == std::string_view::npos ? src.size() : end + 1;

        // Close up to the matching element. Ignore stray closing tags.
        for (size_t i = parents.size() - 1; i > 0; i--) {
            if (parents[i]->tag == tag) {
                flush_text();
                parents.resize(i);
                return;
            }
        }
    }

    void parse_opening_tag()
    {
        pos++;
        Node n(read_name());
        bool self_closing = false;

        while (pos < src.size()) {
            skip_space();
            if (pos >= src.size()) {
                break;
            }
            if (src[pos] == '>') {
                pos++;
                break;
            }
            if (src[pos] == '/') {
                pos++;
                if (pos < src.size() && src[pos] == '>') {
                    self_closing = true;
                    pos++;
                    break;
                }
                continue;
            }

            auto key = read_name();
            if (key.empty()) {
                // Stray '=' or similar
                pos++;
                continue;
            }
            skip_space();
            std::string val;
            if (pos < src.size() && src[pos] == '=') {
                pos++;
                skip_space();
                val = read_value();
            }
            // First occurrence of an attribute wins, as in browsers
            n.attrs.emplace(std::move(key), std::move(val));
        }

        const auto tag = n.tag;
        append(std::move(n));
        if (self_closing || is_void_tag(tag)) {
            return;
        }
        parents.push_back(&parents.back()->children.back());

        if (is_text_content_tag(tag)) {
            parse_text_content(tag);
        }
    }

    std::string read_value()
    {
        if (pos >= src.size()) {
            return "";
        }
        const char quote = src[pos];
        if (quote == '"' || quote == '\'') {
            const auto start = pos + 1;
            auto end = src.find(quote, start);
            if (end == std::string_view::npos) {
                end = src.size();
            }
            pos = end < src.size() ? end + 1 : end;
            return unescape(src.substr(start, end - start));
        }

        const auto start = pos;
        while (pos < src.size() && !is_space(src[pos]) && src[pos] != '>') {
            pos++;
        }
        return unescape(src.substr(start, pos - start));
    }

    // Read contents of script, style, textarea and title elements up to the
    // closing tag
    void parse_text_content(const std::string& tag)
    {
        const auto closing = "</" + tag;
        size_t end = pos;
        while (true) {
            end = src.find("</", end);
            if (end == std::string_view::npos) {
                end = src.size();
                break;
            }
            if (to_lower(src.substr(end, closing.size())) == closing) {
                break;
            }
            end += 2;
        }

        const auto content = src.substr(pos, end - pos);
        if (!content.empty()) {
            const bool raw = tag == "script" || tag == "style";
            parents.back()->children.push_back(Node::text_node(
                raw ? std::string(content) : unescape(content)));
        }
        pos = end;
        if (pos < src.size()) {
            parse_closing_tag();
        } else {
            parents.pop_back();
        }
    }
};

Children parse_html(std::string_view html) { return Parser(html).parse(); }
}
