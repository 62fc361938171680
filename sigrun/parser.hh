#pragma once

#include "node.hh"
#include <string_view>

namespace sigrun {

// Parse an HTML fragment into a list of nodes.
// Parsing is lenient like in browsers: unclosed elements are closed at the
// end of input, stray closing tags are ignored and a '<' not starting a tag is
// treated as text. Never throws.
Children parse_html(std::string_view html);
}
