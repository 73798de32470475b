#ifndef PRECONDITIONS_HPP
#define PRECONDITIONS_HPP

#include "console.hpp"
#include "models.hpp"
#include "options.hpp"
#include "remote_backend.hpp"
#include "stage_result.hpp"

/** @brief Descriptor built from OWNER and REPO_NAME, or an ArgumentError. */
StageResult<RepositoryDescriptor> repository_from_arguments(const Options& opts);

/**
 * @brief Run every check that must pass before anything is created.
 *
 * Checks, in order: two non-empty positional arguments, the backend's tools,
 * the required artifacts under the workspace, the backend credential and the
 * commit identity. Stops at the first failure. Nothing local or remote is
 * modified; the credential check is the only network call, so a missing
 * artifact is reported before anything leaves the machine.
 *
 * @return The descriptor of the repository to create.
 */
StageResult<RepositoryDescriptor> validate_preconditions(const Options& opts,
                                                         RemoteBackend& backend, Console& console);

#endif // PRECONDITIONS_HPP
