#ifndef WORKFLOW_HPP
#define WORKFLOW_HPP

#include "console.hpp"
#include "models.hpp"
#include "options.hpp"
#include "remote_backend.hpp"
#include "stage_result.hpp"

/**
 * @brief Create the remote repository with a single backend call.
 *
 * @return Browser URL of the new repository.
 */
StageResult<std::string> provision_repository(RemoteBackend& backend,
                                              const RepositoryDescriptor& repo, Console& console);

/**
 * @brief Open the pull request from the feature branch into the primary
 * branch with a single backend call.
 */
StageResult<PullRequestInfo> open_pull_request(RemoteBackend& backend,
                                               const RepositoryDescriptor& repo, Console& console);

/**
 * @brief Run the whole bootstrap sequence.
 *
 * Preconditions, repository creation, workspace binding, initial commit,
 * primary branch push, feature branch, documentation commit, feature branch
 * push and pull request, stopping at the first failure. Nothing is retried
 * or rolled back.
 */
StageResult<WorkflowOutcome> run_workflow(const Options& opts, RemoteBackend& backend,
                                          Console& console);

#endif // WORKFLOW_HPP
