#ifndef LOCAL_SYNC_HPP
#define LOCAL_SYNC_HPP

#include <filesystem>
#include <string>

#include "models.hpp"
#include "stage_result.hpp"

/**
 * @brief Turns the working directory into a repository bound to the remote
 * and records the two commits.
 */
class LocalSynchronizer {
  public:
    LocalSynchronizer(std::filesystem::path workspace, std::string remote_name);

    /**
     * @brief Open or initialize the workspace and (re)bind the remote to @p url.
     *
     * Safe to call on a workspace that already has a remote of that name.
     */
    StageResult<Unit> prepare(const std::string& url);

    /// Commit every file in the working tree. @return The new commit hash.
    StageResult<std::string> record_initial_commit();

    /**
     * @brief Append the Development section to README.md and commit only that
     * file.
     *
     * @return The new commit hash.
     */
    StageResult<std::string> record_documentation_commit();

    const std::filesystem::path& workspace() const { return workspace_; }
    const std::string& remote_name() const { return remote_name_; }

  private:
    StageResult<std::string> commit(const CommitSpec& spec);

    std::filesystem::path workspace_;
    std::string remote_name_;
};

#endif // LOCAL_SYNC_HPP
