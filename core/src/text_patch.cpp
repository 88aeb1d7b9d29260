#include "stagehand/text_patch.h"
#include "stagehand/errors.h"

#include <cctype>
#include <limits>

namespace stagehand {

std::string Hunk::before_text() const {
    std::string out;
    for (const auto& op : ops) {
        if (op.kind != DiffKind::INSERT) out += op.text;
    }
    return out;
}

std::string Hunk::after_text() const {
    std::string out;
    for (const auto& op : ops) {
        if (op.kind != DiffKind::DELETE) out += op.text;
    }
    return out;
}

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Splits on '\n'. A trailing newline does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

// --- hunk header "@@ -a[,b] +c[,d] @@"

struct RawRange {
    size_t start{0};
    bool has_len{false};
    std::string len; // digits as written, may be empty after a bare ','
};

bool parse_number(const std::string& s, size_t& i, size_t* out) {
    size_t begin = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
    if (i == begin || i - begin > 18) return false;
    *out = static_cast<size_t>(std::stoull(s.substr(begin, i - begin)));
    return true;
}

bool parse_range(const std::string& s, size_t& i, char sign, RawRange* r) {
    if (i >= s.size() || s[i] != sign) return false;
    i++;
    if (!parse_number(s, i, &r->start)) return false;
    if (i < s.size() && s[i] == ',') {
        i++;
        r->has_len = true;
        size_t begin = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
        r->len = s.substr(begin, i - begin);
        if (r->len.size() > 18) return false;
    }
    return true;
}

bool parse_hunk_header(const std::string& line, RawRange* r1, RawRange* r2, std::string* trailer) {
    if (!starts_with(line, "@@ ")) return false;
    size_t i = 3;
    if (!parse_range(line, i, '-', r1)) return false;
    if (i >= line.size() || line[i] != ' ') return false;
    i++;
    if (!parse_range(line, i, '+', r2)) return false;
    if (line.compare(i, 3, " @@") != 0) return false;
    *trailer = line.substr(i + 3);
    return true;
}

// --- character (diff-match-patch) notation

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool percent_decode(const std::string& in, std::string* out) {
    out->clear();
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] != '%') {
            out->push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return false;
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out->push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

size_t code_points(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) n++;
    }
    return n;
}

// Converts a diff-match-patch range to (0-based start, length).
void char_range(const RawRange& r, size_t* start, size_t* len) {
    if (!r.has_len || r.len.empty()) {
        *start = r.start > 0 ? r.start - 1 : 0;
        *len = 1;
    } else if (r.len == "0") {
        *start = r.start;
        *len = 0;
    } else {
        *start = r.start > 0 ? r.start - 1 : 0;
        *len = static_cast<size_t>(std::stoull(r.len));
    }
}

bool parse_char_patch(const std::vector<std::string>& lines, TextPatch* out, std::string* err) {
    out->format = PatchFormat::CHARACTER;
    out->hunks.clear();
    size_t i = 0;
    while (i < lines.size()) {
        if (lines[i].empty()) { i++; continue; }

        RawRange r1, r2;
        std::string trailer;
        if (!parse_hunk_header(lines[i], &r1, &r2, &trailer) || !(trailer.empty() || trailer == "\r")) {
            *err = "invalid patch header: " + lines[i];
            return false;
        }
        Hunk h;
        h.header = lines[i];
        char_range(r1, &h.start1, &h.length1);
        char_range(r2, &h.start2, &h.length2);
        i++;

        for (; i < lines.size(); i++) {
            const std::string& line = lines[i];
            if (line.empty()) continue;
            if (line[0] == '@') break;
            DiffOp op;
            switch (line[0]) {
                case ' ': op.kind = DiffKind::EQUAL; break;
                case '-': op.kind = DiffKind::DELETE; break;
                case '+': op.kind = DiffKind::INSERT; break;
                default:
                    *err = std::string("invalid patch mode '") + line[0] + "' in " + h.header;
                    return false;
            }
            if (!percent_decode(line.substr(1), &op.text)) {
                *err = "bad percent-encoding in " + h.header;
                return false;
            }
            h.ops.push_back(std::move(op));
        }

        if (code_points(h.before_text()) != h.length1 || code_points(h.after_text()) != h.length2) {
            *err = "hunk body does not match its header " + h.header;
            return false;
        }
        out->hunks.push_back(std::move(h));
    }
    if (out->hunks.empty()) {
        *err = "no hunks found";
        return false;
    }
    return true;
}

// --- unified diff

void mark_no_newline(Hunk& h) {
    if (h.ops.empty()) return;
    std::string& t = h.ops.back().text;
    if (!t.empty() && t.back() == '\n') t.pop_back();
}

TextPatch parse_unified_patch(const std::vector<std::string>& lines) {
    TextPatch out;
    out.format = PatchFormat::UNIFIED;
    size_t i = 0;
    bool seen_minus_header = false;

    while (i < lines.size()) {
        const std::string& line = lines[i];
        if (!starts_with(line, "@@ ")) {
            if (starts_with(line, "--- ")) {
                if (seen_minus_header && !out.hunks.empty()) {
                    throw PatchError("patch touches more than one file");
                }
                seen_minus_header = true;
            } else if (!out.hunks.empty() && !line.empty() && !starts_with(line, "+++ ") &&
                       !starts_with(line, "diff ") && !starts_with(line, "index ")) {
                throw PatchError("unexpected line between hunks: " + line);
            }
            i++;
            continue;
        }

        RawRange r1, r2;
        std::string trailer;
        if (!parse_hunk_header(line, &r1, &r2, &trailer)) {
            throw PatchError("invalid hunk header: " + line);
        }
        Hunk h;
        h.header = line;
        h.start1 = r1.start;
        h.start2 = r2.start;
        h.length1 = (r1.has_len && !r1.len.empty()) ? static_cast<size_t>(std::stoull(r1.len)) : 1;
        h.length2 = (r2.has_len && !r2.len.empty()) ? static_cast<size_t>(std::stoull(r2.len)) : 1;
        if ((h.start1 == 0 && h.length1 > 0) || (h.start2 == 0 && h.length2 > 0)) {
            throw PatchError("invalid hunk header: " + line);
        }
        i++;

        size_t old_left = h.length1;
        size_t new_left = h.length2;
        while (old_left > 0 || new_left > 0) {
            if (i >= lines.size()) throw PatchError("hunk " + h.header + " ends early");
            const std::string& b = lines[i++];
            const char sign = b.empty() ? ' ' : b[0];
            const std::string body = b.empty() ? std::string() : b.substr(1) + "\n";
            if (sign == '\\') {
                mark_no_newline(h);
                continue;
            }
            if (sign == ' ' && old_left > 0 && new_left > 0) {
                h.ops.push_back({DiffKind::EQUAL, b.empty() ? std::string("\n") : body});
                old_left--;
                new_left--;
            } else if (sign == '-' && old_left > 0) {
                h.ops.push_back({DiffKind::DELETE, body});
                old_left--;
            } else if (sign == '+' && new_left > 0) {
                h.ops.push_back({DiffKind::INSERT, body});
                new_left--;
            } else {
                throw PatchError("malformed line in hunk " + h.header + ": " + b);
            }
        }
        while (i < lines.size() && starts_with(lines[i], "\\")) {
            mark_no_newline(h);
            i++;
        }
        out.hunks.push_back(std::move(h));
    }

    if (out.hunks.empty()) throw PatchError("no hunks found");
    return out;
}

// --- application

size_t cp_to_byte(const std::string& text, size_t cp) {
    size_t i = 0;
    size_t n = 0;
    while (i < text.size()) {
        if (n == cp) return i;
        i++;
        while (i < text.size() && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) i++;
        n++;
    }
    return text.size();
}

size_t line_to_byte(const std::string& text, size_t line) {
    size_t pos = 0;
    for (size_t l = 0; l < line; l++) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) return text.size();
        pos = nl + 1;
    }
    return pos;
}

size_t line_index(const std::string& text, size_t pos) {
    size_t n = 0;
    for (size_t i = 0; i < pos && i < text.size(); i++) {
        if (text[i] == '\n') n++;
    }
    return n;
}

// Occurrence of needle closest to hint. In line mode a match must begin at a
// line start, and a needle without a final newline must end the text.
bool find_nearest(const std::string& text, const std::string& needle, size_t hint, bool lines,
                  size_t* out) {
    bool found = false;
    size_t best = 0;
    size_t best_dist = std::numeric_limits<size_t>::max();
    for (size_t p = text.find(needle); p != std::string::npos; p = text.find(needle, p + 1)) {
        if (lines) {
            if (p > 0 && text[p - 1] != '\n') continue;
            if (needle.back() != '\n' && p + needle.size() != text.size()) continue;
        }
        size_t dist = p > hint ? p - hint : hint - p;
        if (dist < best_dist) {
            best = p;
            best_dist = dist;
            found = true;
        } else if (p > hint) {
            break;
        }
    }
    if (found) *out = best;
    return found;
}

} // namespace

TextPatch parse_text_patch(const std::string& text) {
    std::vector<std::string> lines = split_lines(text);

    bool file_headers = false;
    for (const auto& l : lines) {
        if (starts_with(l, "@@ ")) break;
        if (starts_with(l, "--- ") || starts_with(l, "+++ ")) {
            file_headers = true;
            break;
        }
    }
    if (!file_headers) {
        TextPatch p;
        std::string err;
        if (parse_char_patch(lines, &p, &err)) {
            try {
                p.unified_hunks = parse_unified_patch(lines).hunks;
            } catch (const PatchError&) {
                p.unified_hunks.clear();
            }
            return p;
        }
    }
    return parse_unified_patch(lines);
}

static std::string apply_hunks(const std::vector<Hunk>& hunks, bool lines, const std::string& target) {
    std::string text = target;
    long long delta = 0; // drift between header and actual positions, in units

    for (size_t k = 0; k < hunks.size(); k++) {
        const Hunk& h = hunks[k];
        const std::string before = h.before_text();
        const std::string after = h.after_text();

        long long expected = static_cast<long long>(h.start2);
        if (lines && h.length2 > 0) expected -= 1;
        expected += delta;
        if (expected < 0) expected = 0;

        const size_t hint = lines ? line_to_byte(text, static_cast<size_t>(expected))
                                  : cp_to_byte(text, static_cast<size_t>(expected));
        size_t pos = hint;
        if (!before.empty() && !find_nearest(text, before, hint, lines, &pos)) {
            throw PatchError("hunk #" + std::to_string(k + 1) + " " + h.header + " does not apply");
        }

        const size_t actual = lines ? line_index(text, pos) : code_points(text.substr(0, pos));
        delta += static_cast<long long>(actual) - expected;
        text.replace(pos, before.size(), after);
    }
    return text;
}

std::string apply_text_patch(const TextPatch& patch, const std::string& target) {
    const bool lines = patch.format == PatchFormat::UNIFIED;
    if (lines || patch.unified_hunks.empty()) return apply_hunks(patch.hunks, lines, target);
    try {
        return apply_hunks(patch.hunks, false, target);
    } catch (const PatchError& e) {
        try {
            return apply_hunks(patch.unified_hunks, true, target);
        } catch (const PatchError&) {
            throw e;
        }
    }
}

} // namespace stagehand
