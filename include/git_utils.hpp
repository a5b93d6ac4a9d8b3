#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so guards may be nested freely
 * across threads.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using reference_iterator_ptr = GitHandle<git_reference_iterator, git_reference_iterator_free>;

/**
 * @brief Reference inventory of a local (bare) mirror.
 */
struct MirrorSummary {
    size_t refs = 0;                       ///< All references, symbolic ones included
    std::vector<std::string> branches;     ///< Short names below refs/heads/
    size_t tags = 0;                       ///< References below refs/tags/
    std::optional<std::string> head;       ///< Branch HEAD points at, if symbolic
    bool bare = false;

    bool has_branch(const std::string& name) const;
};

/**
 * @brief Enumerate the references of the repository at @p repo.
 *
 * Assumes libgit2 is initialized.
 *
 * @param repo  Path to a repository (bare or not).
 * @param error Optional output receiving the libgit2 error message.
 * @return The inventory, or `std::nullopt` if the repository cannot be read.
 */
std::optional<MirrorSummary> inspect_mirror(const fs::path& repo, std::string* error = nullptr);

/** @brief Last libgit2 error message, or a generic text. */
std::string last_error_message();

} // namespace git

#endif // GIT_UTILS_HPP
