#ifndef BRANCH_PUBLISHER_HPP
#define BRANCH_PUBLISHER_HPP

#include <filesystem>
#include <string>

#include "models.hpp"
#include "remote_backend.hpp"
#include "stage_result.hpp"

/**
 * @brief Names, pushes and tracks the primary and feature branches.
 *
 * Pushed branches are never rolled back when a later step fails.
 */
class BranchPublisher {
  public:
    BranchPublisher(std::filesystem::path workspace, std::string remote_name,
                    RemoteBackend& backend);

    /// Rename the current branch to the primary branch, push it and track it.
    StageResult<Unit> publish_primary();

    /// Create the feature branch at the tip of its base and check it out.
    StageResult<Unit> start_feature();

    StageResult<Unit> publish_feature();

  private:
    StageResult<Unit> publish(const BranchRef& branch);

    std::filesystem::path workspace_;
    std::string remote_name_;
    RemoteBackend& backend_;
};

#endif // BRANCH_PUBLISHER_HPP
