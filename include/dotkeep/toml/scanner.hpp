#pragma once

#include <dotkeep/result.hpp>
#include <string>
#include <vector>

namespace dotkeep {

// One segment of a (possibly dotted) key. offset/length locate the raw key
// token inside the text of the node that owns it.
struct KeySegment {
    std::string name;     // decoded key
    size_t offset = 0;
    size_t length = 0;
};

using KeyPath = std::vector<KeySegment>;

// A key/value pair, verbatim. `decor` holds the blank and comment lines
// directly above it; `text` runs from the key to the end of the value's line
// (inclusive of the newline, when present) and may span several lines.
struct TomlEntry {
    std::string decor;
    std::string text;
    KeyPath key;
};

// A table introduced by a [header] or [[header]] line. The root table has an
// empty header and key.
struct TomlTable {
    std::string decor;
    std::string header;
    KeyPath key;
    bool is_array = false;
    std::vector<TomlEntry> entries;
};

// Lossless segmentation of a TOML document. render() reproduces the scanned
// text byte for byte.
struct TomlLayout {
    std::string bom;                // leading UTF-8 byte-order mark, if any
    std::vector<TomlTable> tables;  // tables[0] is the root table
    std::string trailer;            // trivia after the last node

    std::string render() const;
};

// Segment TOML text into tables and entries. Only structure is checked here;
// callers validate full TOML semantics separately.
Result<TomlLayout> scan_toml(const std::string& text,
                             const std::string& origin = "<input>");

// Decoded names of a key path
std::vector<std::string> key_names(const KeyPath& key);

// Render a key as a bare key when possible, else as a quoted string
std::string format_key(const std::string& name);

// Render a TOML basic string literal, escaping as needed
std::string quote_string(const std::string& value);

// Rewrite segment `index` of `key` inside `text` to `new_name`, shifting the
// offsets of later segments.
void rename_key_segment(std::string& text, KeyPath& key, size_t index,
                        const std::string& new_name);

} // namespace dotkeep
