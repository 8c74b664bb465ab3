#include <fngrader/sandbox/scratch_area.hpp>

#include <fngrader/common/expected.hpp>
#include <fngrader/common/linux.hpp>
#include <fngrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>

namespace fngrader {

namespace fs = std::filesystem;

ScratchArea::ScratchArea(fs::path root)
    : root_{std::move(root)} {}

Expected<ScratchArea, std::string> ScratchArea::create(const fs::path& parent) {
    auto root = linux::mkdtemp((parent / "fngrader-XXXXXX").string());

    if (!root) {
        return fmt::format("Failed to create a scratch area under {:?}: {}", parent.string(), root.error().message());
    }

    ScratchArea res{fs::path{root.value()}};

    std::error_code err;
    fs::create_directory(res.app_dir(), err);

    if (err) {
        return fmt::format("Failed to create {:?}: {}", res.app_dir().string(), err.message());
    }

    LOG_DEBUG("Created scratch area {:?}", res.root().string());

    return res;
}

ScratchArea::~ScratchArea() {
    if (!root_.empty()) {
        if (auto res = remove(); !res) {
            LOG_ERROR("Leaking scratch area: {}", res.error());
        }
    }
}

ScratchArea::ScratchArea(ScratchArea&& other) noexcept
    : root_{std::exchange(other.root_, {})} {}

ScratchArea& ScratchArea::operator=(ScratchArea&& rhs) noexcept {
    if (this != &rhs) {
        std::ignore = remove();
        root_ = std::exchange(rhs.root_, {});
    }
    return *this;
}

Expected<void, std::string> ScratchArea::copy_in(const fs::path& program) const {
    std::error_code err;
    fs::copy_file(program, program_path(), fs::copy_options::overwrite_existing, err);

    if (err) {
        return fmt::format("Failed to copy {:?} into the scratch area: {}", program.string(), err.message());
    }

    return {};
}

Expected<void, std::string> ScratchArea::remove() {
    if (root_.empty()) {
        return {};
    }

    std::error_code err;
    fs::remove_all(root_, err);

    if (err) {
        // The program may have made directories unwritable; restore owner permissions and retry
        LOG_DEBUG("Retrying removal of {:?} after restoring permissions ({})", root_.string(), err.message());

        std::error_code walk_err;
        fs::permissions(root_, fs::perms::owner_all, fs::perm_options::add, walk_err);
        for (auto iter = fs::recursive_directory_iterator{root_, walk_err}; !walk_err && iter != fs::end(iter);
             iter.increment(walk_err)) {
            if (iter->is_directory(walk_err) && !iter->is_symlink(walk_err)) {
                fs::permissions(iter->path(), fs::perms::owner_all, fs::perm_options::add, walk_err);
            }
        }

        err.clear();
        fs::remove_all(root_, err);
    }

    if (err) {
        return fmt::format("Failed to remove scratch area {:?}: {}", root_.string(), err.message());
    }

    LOG_DEBUG("Removed scratch area {:?}", root_.string());
    root_.clear();

    return {};
}

} // namespace fngrader
