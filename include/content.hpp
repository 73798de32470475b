#ifndef CONTENT_HPP
#define CONTENT_HPP

#include <string>
#include <vector>

#include "models.hpp"

/**
 * Fixed texts and names shared by the workflow stages: the artifact list the
 * validator checks, the two commits, the two branches and the pull request.
 */
namespace content {

constexpr const char* PRIMARY_BRANCH = "main";
constexpr const char* FEATURE_BRANCH = "feature/prototype-pipeline";
constexpr const char* README_PATH = "README.md";

/**
 * @brief A file that must exist before anything is created.
 *
 * `summary` and `details` feed the "Key Components" section of the pull
 * request body.
 */
struct RequiredArtifact {
    std::string path;
    std::string summary;
    std::vector<std::string> details;
};

/** @return The required artifacts in validation order. */
const std::vector<RequiredArtifact>& required_artifacts();

/** @return Paths of required_artifacts(), in the same order. */
std::vector<std::string> required_paths();

std::string default_description();

BranchRef primary_branch();
BranchRef feature_branch();

/** @return Commit covering every file in the working tree. */
CommitSpec initial_commit();

/** @return Commit touching only README.md. */
CommitSpec documentation_commit();

/** @return Markdown appended to README.md by the documentation commit. */
std::string readme_development_section();

/**
 * @brief Pull request from feature_branch() into primary_branch().
 *
 * The body lists every entry of required_artifacts().
 */
PullRequestSpec pull_request();

} // namespace content

#endif // CONTENT_HPP
