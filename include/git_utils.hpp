#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
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
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using index_ptr = GitHandle<git_index, git_index_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using signature_ptr = GitHandle<git_signature, git_signature_free>;
using config_ptr = GitHandle<git_config, git_config_free>;
using diff_ptr = GitHandle<git_diff, git_diff_free>;

/**
 * @brief Username/password pair offered when a push needs authentication.
 *
 * An empty password means "no explicit credential": a username embedded in
 * the remote URL is then used as a token.
 */
struct PushCredentials {
    std::string username;
    std::string password;
};

struct Identity {
    std::string name;
    std::string email;
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is a Git repository.
 *
 * @return `true` if a `.git` directory exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Read `user.name` and `user.email`.
 *
 * Uses the repository configuration when @p workspace is already a
 * repository, otherwise the user's global configuration.
 *
 * @return Both values, or `std::nullopt` if either is missing or empty.
 */
std::optional<Identity> configured_identity(const fs::path& workspace,
                                            std::string* error = nullptr);

/**
 * @brief Open the repository at @p workspace, initializing it when absent.
 */
bool open_or_init(const fs::path& workspace, std::string* error = nullptr);

/**
 * @brief Point remote @p name at @p url, replacing any existing remote of
 * that name.
 */
bool bind_remote(const fs::path& repo, const std::string& name, const std::string& url,
                 std::string* error = nullptr);

std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Stage files and create a commit on the current branch.
 *
 * @param paths   Paths relative to the work tree; empty stages every file
 *                that is not ignored.
 * @param message Commit message.
 * @return Hash of the new commit, or `std::nullopt` when staging or committing
 *         fails or the resulting tree equals the parent's.
 */
std::optional<std::string> commit_paths(const fs::path& repo, const std::vector<std::string>& paths,
                                        const std::string& message, std::string* error = nullptr);

/**
 * @brief List files changed by @p rev relative to its first parent (or all
 * files for a root commit).
 */
std::vector<std::string> changed_paths(const fs::path& repo, const std::string& rev,
                                       std::string* error = nullptr);

/**
 * @brief Name of the branch HEAD points to, also for an unborn branch.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Rename the current branch, or retarget HEAD when it is unborn.
 */
bool rename_current_branch(const fs::path& repo, const std::string& new_name,
                           std::string* error = nullptr);

/**
 * @brief Create @p name at the tip of local branch @p base.
 */
bool create_branch(const fs::path& repo, const std::string& name, const std::string& base,
                   std::string* error = nullptr);

/**
 * @brief Check out local branch @p name and make it HEAD.
 */
bool checkout_branch(const fs::path& repo, const std::string& name, std::string* error = nullptr);

/**
 * @brief Push `refs/heads/<branch>` to the same name on @p remote.
 *
 * @param creds Credentials offered to the server, or `nullptr`.
 * @return `false` with @p error set when the push fails or the server rejects
 *         the update.
 */
bool push_branch(const fs::path& repo, const std::string& remote, const std::string& branch,
                 const PushCredentials* creds, std::string* error = nullptr);

/**
 * @brief Record `<remote>/<branch>` as the upstream of local @p branch.
 */
bool set_upstream(const fs::path& repo, const std::string& branch, const std::string& remote,
                  std::string* error = nullptr);

/** @return `<remote>/<branch>` configured for @p branch, if any. */
std::optional<std::string> get_upstream(const fs::path& repo, const std::string& branch);

/**
 * @brief Resolve a reference or revision to a commit hash.
 */
std::optional<std::string> resolve_ref(const fs::path& repo, const std::string& rev,
                                       std::string* error = nullptr);

/**
 * @brief libgit2 credential callback.
 *
 * @p payload must point to a PushCredentials instance or be null.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

} // namespace git

#endif // GIT_UTILS_HPP
