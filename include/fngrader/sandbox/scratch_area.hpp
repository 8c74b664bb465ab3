#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/common/expected.hpp>

#include <filesystem>
#include <string>

namespace fngrader {

/// A uniquely named, private (0700) directory owned for the duration of one execution.
///
/// Layout:
///   <root>/app/harness.py  - the copied program; <root>/app is the program's working directory
///   <root>/...             - anything a backend needs alongside, e.g. a private root filesystem
///
/// The directory is removed by `remove` or, failing that, by the destructor.
class ScratchArea : NonCopyable
{
public:
    static constexpr const char* PROGRAM_NAME = "harness.py";

    /// Creates `<parent>/fngrader-XXXXXX`
    static Expected<ScratchArea, std::string> create(const std::filesystem::path& parent);

    ~ScratchArea();
    ScratchArea(ScratchArea&& other) noexcept;
    ScratchArea& operator=(ScratchArea&& rhs) noexcept;

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path app_dir() const { return root_ / "app"; }

    std::filesystem::path program_path() const { return app_dir() / PROGRAM_NAME; }

    /// Copies `program` to `program_path()`
    Expected<void, std::string> copy_in(const std::filesystem::path& program) const;

    /// Removes the whole tree, restoring permissions the program may have revoked.
    /// Safe to call more than once.
    Expected<void, std::string> remove();

private:
    explicit ScratchArea(std::filesystem::path root);

    /// Empty once removed or moved from
    std::filesystem::path root_;
};

} // namespace fngrader
