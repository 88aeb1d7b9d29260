#include "stagehand/patch_applier.h"
#include "stagehand/errors.h"
#include "stagehand/text_patch.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

std::vector<std::string> list_files_sorted(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw std::runtime_error("'" + root.string() + "' is not a directory");
    }
    std::vector<std::string> out;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) out.push_back(it->path().lexically_relative(root).generic_string());
    }
    if (ec) throw std::runtime_error("cannot list '" + root.string() + "': " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

static bool read_all(const fs::path& p, std::string* out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;
    out->assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool PatchApplier::apply_one(const fs::path& patch_file, const fs::path& target, std::string* err) {
    std::string patch_text;
    if (!read_all(patch_file, &patch_text)) {
        *err = "cannot read patch file";
        return false;
    }
    std::string content;
    if (!read_all(target, &content)) {
        *err = "cannot read target '" + target.string() + "'";
        return false;
    }

    std::string patched;
    try {
        patched = apply_text_patch(parse_text_patch(patch_text), content);
    } catch (const PatchError& e) {
        *err = e.what();
        return false;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(patched.data(), static_cast<std::streamsize>(patched.size()));
    out.close();
    if (!out) {
        *err = "cannot write target '" + target.string() + "'";
        return false;
    }
    return true;
}

std::vector<std::string> PatchApplier::apply_tree(const fs::path& patch_root, const fs::path& target_root) {
    const std::vector<std::string> patches = list_files_sorted(patch_root);
    std::vector<fs::path> touched;
    std::vector<PatchFailure> failures;

    for (const auto& rel : patches) {
        const fs::path target = target_root / rel;
        std::error_code ec;
        if (!fs::is_regular_file(target, ec)) {
            failures.push_back({rel, "target file does not exist"});
            log_.error("Patch '" + rel + "' has no target at '" + target.string() + "'");
            continue;
        }

        try {
            if (BackupStore::has_backup(target)) {
                backups_.restore_from_backup(target);
            } else {
                backups_.ensure_backup(target);
            }
        } catch (const std::exception& e) {
            failures.push_back({rel, e.what()});
            log_.error("Cannot prepare '" + rel + "' for patching: " + e.what());
            continue;
        }
        touched.push_back(target);

        std::string err;
        if (!apply_one(patch_root / rel, target, &err)) {
            failures.push_back({rel, err});
            log_.error("Failed to apply patch '" + rel + "': " + err);
            continue;
        }
        log_.debug("Applied patch '" + rel + "'");
    }

    if (failures.empty()) {
        log_.info("Applied " + std::to_string(patches.size()) + " patch(es)");
        return patches;
    }

    log_.warn("Rolling back " + std::to_string(touched.size()) + " patched file(s)...");
    std::string rollback_problems;
    for (const auto& t : touched) {
        try {
            if (!backups_.rollback(t)) {
                rollback_problems += "; no backup for '" + t.string() + "'";
                log_.error("No backup to roll back '" + t.string() + "'");
            }
        } catch (const std::exception& e) {
            rollback_problems += std::string("; ") + e.what();
            log_.error(e.what());
        }
    }

    std::string msg = "failed to apply " + std::to_string(failures.size()) + " patch(es):";
    for (size_t i = 0; i < failures.size(); i++) {
        msg += (i ? ", '" : " '") + failures[i].patch + "' (" + failures[i].reason + ")";
    }
    if (!rollback_problems.empty()) msg += "; rollback incomplete" + rollback_problems;
    throw PatchError(msg);
}

} // namespace stagehand
