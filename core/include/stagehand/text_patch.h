#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace stagehand {

// CHARACTER: diff-match-patch text notation, coordinates in code points and
// percent-encoded bodies. UNIFIED: classic line-based unified diff.
enum class PatchFormat { CHARACTER, UNIFIED };

enum class DiffKind { EQUAL, DELETE, INSERT };

struct DiffOp {
    DiffKind kind;
    std::string text; // UNIFIED: whole lines including their '\n'
};

// CHARACTER hunks hold 0-based starts (diff-match-patch convention), UNIFIED
// hunks the 1-based numbers from the header.
struct Hunk {
    size_t start1{0};
    size_t length1{0};
    size_t start2{0};
    size_t length2{0};
    std::vector<DiffOp> ops;
    std::string header; // "@@ ... @@" line as written

    std::string before_text() const; // EQUAL + DELETE
    std::string after_text() const;  // EQUAL + INSERT
};

struct TextPatch {
    PatchFormat format{PatchFormat::UNIFIED};
    std::vector<Hunk> hunks;
    // Headerless input that also reads as unified hunks keeps that reading
    // here; it is applied when the character hunks do not.
    std::vector<Hunk> unified_hunks;
};

// Detects the format and parses. Throws PatchError on malformed input or a
// patch without hunks.
TextPatch parse_text_patch(const std::string& text);

// Applies every hunk or throws PatchError naming the first hunk whose
// before-text is not found. A headerless patch that fails as a character
// patch is retried with its unified reading. Each hunk matches exactly, at the occurrence
// nearest to where the header says it should be (line hunks only at line
// starts).
std::string apply_text_patch(const TextPatch& patch, const std::string& target);

} // namespace stagehand
