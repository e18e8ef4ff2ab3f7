#include <dotkeep/toml/scanner.hpp>

#include <cctype>
#include <cstdint>
#include <cstring>

namespace dotkeep {

static bool is_bare_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

namespace {

// Single pass over the document. Every byte ends up in exactly one decor,
// header, entry text or the trailer, which is what makes render() lossless.
class Scanner {
public:
    Scanner(const std::string& src, const std::string& origin)
        : src_(src), origin_(origin) {}

    Result<TomlLayout> run();

private:
    const std::string& src_;
    const std::string& origin_;
    size_t pos_ = 0;
    size_t start_ = 0;  // first byte after any byte-order mark

    bool eof() const { return pos_ >= src_.size(); }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }
    bool at_newline() const {
        return peek() == '\n' || (peek() == '\r' && peek(1) == '\n');
    }
    bool starts_with(const char* s) const {
        return src_.compare(pos_, std::strlen(s), s) == 0;
    }

    void skip_ws() {
        while (peek() == ' ' || peek() == '\t') ++pos_;
    }
    void skip_newline() {
        if (peek() == '\r') ++pos_;
        if (peek() == '\n') ++pos_;
    }
    void skip_to_line_end() {
        while (!eof() && !at_newline()) ++pos_;
    }
    void skip_ws_comments_newlines() {
        for (;;) {
            skip_ws();
            if (peek() == '#') {
                skip_to_line_end();
            } else if (at_newline()) {
                skip_newline();
            } else {
                return;
            }
        }
    }

    DotkeepError error_at(size_t at, const std::string& msg) const;

    Status finish_line();
    Result<KeyPath> parse_key(size_t base);
    Result<std::string> parse_basic_string();

    Status scan_value();
    Status scan_multiline(const char* delim, bool escapes);
    Status scan_array();
    Status scan_inline_table();
    Status scan_scalar();
};

DotkeepError Scanner::error_at(size_t at, const std::string& msg) const {
    int line = 1;
    int col = 1;
    for (size_t i = start_; i < at && i < src_.size(); ++i) {
        if (src_[i] == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
    }
    return DotkeepError{DotkeepError::Parse, msg, "", origin_, line, col};
}

Status Scanner::finish_line() {
    skip_ws();
    if (peek() == '#') skip_to_line_end();
    if (eof()) return ok_status();
    if (!at_newline()) {
        return error_at(pos_, "expected end of line");
    }
    skip_newline();
    return ok_status();
}

Result<std::string> Scanner::parse_basic_string() {
    size_t start = pos_;
    ++pos_;  // opening quote
    std::string out;

    for (;;) {
        if (eof() || at_newline()) {
            return error_at(start, "unterminated string");
        }
        char c = src_[pos_++];
        if (c == '"') break;
        if (c != '\\') {
            out += c;
            continue;
        }

        char e = peek();
        ++pos_;
        switch (e) {
            case 'b':  out += '\b'; break;
            case 't':  out += '\t'; break;
            case 'n':  out += '\n'; break;
            case 'f':  out += '\f'; break;
            case 'r':  out += '\r'; break;
            case 'e':  out += '\x1b'; break;
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case 'u':
            case 'U': {
                size_t digits = (e == 'u') ? 4 : 8;
                if (pos_ + digits > src_.size()) {
                    return error_at(pos_, "truncated unicode escape");
                }
                uint32_t cp = 0;
                for (size_t i = 0; i < digits; ++i) {
                    char h = src_[pos_ + i];
                    if (!std::isxdigit(static_cast<unsigned char>(h))) {
                        return error_at(pos_ + i, "invalid unicode escape");
                    }
                    cp = cp * 16 + static_cast<uint32_t>(
                        std::isdigit(static_cast<unsigned char>(h))
                            ? h - '0'
                            : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                }
                pos_ += digits;
                append_utf8(out, cp);
                break;
            }
            default:
                return error_at(pos_ - 1, "invalid escape sequence");
        }
    }
    return Result<std::string>::ok(std::move(out));
}

Result<KeyPath> Scanner::parse_key(size_t base) {
    KeyPath path;

    for (;;) {
        skip_ws();
        KeySegment seg;
        size_t start = pos_;

        if (peek() == '"') {
            auto s = parse_basic_string();
            if (s.is_err()) return std::move(s).error();
            seg.name = std::move(s).value();
        } else if (peek() == '\'') {
            ++pos_;
            size_t from = pos_;
            while (!eof() && peek() != '\'' && !at_newline()) ++pos_;
            if (peek() != '\'') {
                return error_at(start, "unterminated literal key");
            }
            seg.name = src_.substr(from, pos_ - from);
            ++pos_;
        } else {
            while (!eof() && is_bare_key_char(peek())) ++pos_;
            if (pos_ == start) {
                return error_at(start, "expected key");
            }
            seg.name = src_.substr(start, pos_ - start);
        }

        seg.offset = start - base;
        seg.length = pos_ - start;
        path.push_back(std::move(seg));

        skip_ws();
        if (peek() != '.') break;
        ++pos_;
    }

    return Result<KeyPath>::ok(std::move(path));
}

Status Scanner::scan_multiline(const char* delim, bool escapes) {
    size_t start = pos_;
    pos_ += 3;
    for (;;) {
        if (eof()) {
            return error_at(start, "unterminated multi-line string");
        }
        if (escapes && peek() == '\\') {
            pos_ += 2;
            continue;
        }
        if (starts_with(delim)) {
            pos_ += 3;
            // Up to two quotes may directly precede the closing delimiter
            for (int extra = 0; extra < 2 && peek() == delim[0]; ++extra) ++pos_;
            return ok_status();
        }
        ++pos_;
    }
}

Status Scanner::scan_array() {
    size_t start = pos_;
    ++pos_;
    for (;;) {
        skip_ws_comments_newlines();
        if (eof()) return error_at(start, "unterminated array");
        if (peek() == ']') {
            ++pos_;
            return ok_status();
        }

        DOTKEEP_TRY(scan_value());

        skip_ws_comments_newlines();
        if (peek() == ',') {
            ++pos_;
        } else if (peek() == ']') {
            ++pos_;
            return ok_status();
        } else {
            return error_at(pos_, "expected ',' or ']' in array");
        }
    }
}

Status Scanner::scan_inline_table() {
    size_t start = pos_;
    ++pos_;
    skip_ws_comments_newlines();
    if (peek() == '}') {
        ++pos_;
        return ok_status();
    }

    for (;;) {
        auto key = parse_key(pos_);
        if (key.is_err()) return std::move(key).error();

        skip_ws();
        if (peek() != '=') return error_at(pos_, "expected '=' in inline table");
        ++pos_;
        skip_ws();

        DOTKEEP_TRY(scan_value());

        skip_ws_comments_newlines();
        if (eof()) return error_at(start, "unterminated inline table");
        if (peek() == '}') {
            ++pos_;
            return ok_status();
        }
        if (peek() != ',') return error_at(pos_, "expected ',' or '}' in inline table");
        ++pos_;
        skip_ws_comments_newlines();
        if (peek() == '}') {
            ++pos_;
            return ok_status();
        }
    }
}

Status Scanner::scan_scalar() {
    size_t start = pos_;
    auto scan_token = [this]() {
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
                c == ',' || c == ']' || c == '}' || c == '#') {
                break;
            }
            ++pos_;
        }
    };

    scan_token();
    // Date-times may separate date and time with a space
    if (pos_ - start == 10 && src_[start + 4] == '-' && src_[start + 7] == '-' &&
        peek() == ' ' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        ++pos_;
        scan_token();
    }

    if (pos_ == start) return error_at(start, "expected value");
    return ok_status();
}

Status Scanner::scan_value() {
    if (starts_with("\"\"\"")) return scan_multiline("\"\"\"", true);
    if (starts_with("'''")) return scan_multiline("'''", false);

    switch (peek()) {
        case '"': {
            auto s = parse_basic_string();
            if (s.is_err()) return std::move(s).error();
            return ok_status();
        }
        case '\'': {
            size_t start = pos_;
            ++pos_;
            while (!eof() && peek() != '\'' && !at_newline()) ++pos_;
            if (peek() != '\'') return error_at(start, "unterminated literal string");
            ++pos_;
            return ok_status();
        }
        case '[':
            return scan_array();
        case '{':
            return scan_inline_table();
        default:
            return scan_scalar();
    }
}

Result<TomlLayout> Scanner::run() {
    TomlLayout layout;
    layout.tables.emplace_back();
    std::string pending;

    static const char kBom[] = "\xEF\xBB\xBF";
    if (starts_with(kBom)) {
        layout.bom = kBom;
        pos_ = start_ = layout.bom.size();
    }

    while (!eof()) {
        size_t line_start = pos_;
        skip_ws();

        if (eof()) {
            pending.append(src_, line_start, std::string::npos);
            break;
        }

        // Blank or comment line
        if (at_newline() || peek() == '#') {
            skip_to_line_end();
            skip_newline();
            pending.append(src_, line_start, pos_ - line_start);
            continue;
        }

        if (peek() == '[') {
            TomlTable table;
            ++pos_;
            if (peek() == '[') {
                table.is_array = true;
                ++pos_;
            }

            auto key = parse_key(line_start);
            if (key.is_err()) return std::move(key).error();

            skip_ws();
            if (peek() != ']') return error_at(pos_, "expected ']' after table name");
            ++pos_;
            if (table.is_array) {
                if (peek() != ']') return error_at(pos_, "expected ']]' after table name");
                ++pos_;
            }
            DOTKEEP_TRY(finish_line());

            table.decor = std::move(pending);
            pending.clear();
            table.header = src_.substr(line_start, pos_ - line_start);
            table.key = std::move(key).value();
            layout.tables.push_back(std::move(table));
            continue;
        }

        auto key = parse_key(line_start);
        if (key.is_err()) return std::move(key).error();

        skip_ws();
        if (peek() != '=') return error_at(pos_, "expected '=' after key");
        ++pos_;
        skip_ws();

        DOTKEEP_TRY(scan_value());
        DOTKEEP_TRY(finish_line());

        TomlEntry entry;
        entry.decor = std::move(pending);
        pending.clear();
        entry.text = src_.substr(line_start, pos_ - line_start);
        entry.key = std::move(key).value();
        layout.tables.back().entries.push_back(std::move(entry));
    }

    layout.trailer = std::move(pending);
    return Result<TomlLayout>::ok(std::move(layout));
}

} // anonymous namespace

std::string TomlLayout::render() const {
    std::string out = bom;
    for (const auto& table : tables) {
        out += table.decor;
        out += table.header;
        for (const auto& entry : table.entries) {
            out += entry.decor;
            out += entry.text;
        }
    }
    out += trailer;
    return out;
}

Result<TomlLayout> scan_toml(const std::string& text, const std::string& origin) {
    Scanner scanner(text, origin);
    return scanner.run();
}

std::vector<std::string> key_names(const KeyPath& key) {
    std::vector<std::string> names;
    names.reserve(key.size());
    for (const auto& seg : key) names.push_back(seg.name);
    return names;
}

std::string format_key(const std::string& name) {
    bool bare = !name.empty();
    for (char c : name) {
        if (!is_bare_key_char(c)) {
            bare = false;
            break;
        }
    }
    return bare ? name : quote_string(name);
}

std::string quote_string(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default: {
                auto uc = static_cast<unsigned char>(c);
                if (uc < 0x20 || uc == 0x7F) {
                    out += "\\u00";
                    out += hex[uc >> 4];
                    out += hex[uc & 0x0F];
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
    return out;
}

void rename_key_segment(std::string& text, KeyPath& key, size_t index,
                        const std::string& new_name) {
    KeySegment& seg = key[index];
    std::string raw = format_key(new_name);
    size_t old_length = seg.length;

    text.replace(seg.offset, old_length, raw);
    seg.name = new_name;
    seg.length = raw.size();

    for (size_t i = index + 1; i < key.size(); ++i) {
        key[i].offset = key[i].offset + raw.size() - old_length;
    }
}

} // namespace dotkeep
