#include "git_utils.hpp"

#include <algorithm>

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

std::string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

bool MirrorSummary::has_branch(const std::string& name) const {
    return std::find(branches.begin(), branches.end(), name) != branches.end();
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

/**
 * @brief Walk every reference of a repository.
 *
 * Symbolic references are counted but not resolved, so a dangling HEAD in a
 * freshly cloned empty mirror does not make the walk fail.
 */
std::optional<MirrorSummary> inspect_mirror(const fs::path& repo, std::string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        if (error)
            *error = last_error_message();
        return std::nullopt;
    }
    repo_ptr r(raw_repo);
    MirrorSummary summary;
    summary.bare = git_repository_is_bare(r.get()) == 1;

    git_reference* raw_head = nullptr;
    if (git_reference_lookup(&raw_head, r.get(), "HEAD") == 0) {
        reference_ptr head(raw_head);
        if (git_reference_type(head.get()) == GIT_REFERENCE_SYMBOLIC) {
            std::string target = git_reference_symbolic_target(head.get());
            if (starts_with(target, "refs/heads/"))
                summary.head = target.substr(11);
        }
    }

    git_reference_iterator* raw_it = nullptr;
    if (git_reference_iterator_new(&raw_it, r.get()) != 0) {
        if (error)
            *error = last_error_message();
        return std::nullopt;
    }
    reference_iterator_ptr it(raw_it);
    git_reference* raw_ref = nullptr;
    int rc = 0;
    while ((rc = git_reference_next(&raw_ref, it.get())) == 0) {
        reference_ptr ref(raw_ref);
        std::string name = git_reference_name(ref.get());
        ++summary.refs;
        if (starts_with(name, "refs/heads/"))
            summary.branches.push_back(name.substr(11));
        else if (starts_with(name, "refs/tags/"))
            ++summary.tags;
    }
    if (rc != GIT_ITEROVER) {
        if (error)
            *error = last_error_message();
        return std::nullopt;
    }
    std::sort(summary.branches.begin(), summary.branches.end());
    return summary;
}

} // namespace git
