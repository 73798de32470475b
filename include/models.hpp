#ifndef MODELS_HPP
#define MODELS_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Visibility { Public, Private };

/**
 * @brief Identity and creation settings of the remote repository.
 *
 * Built once from the command line and configuration, then treated as
 * read-only by every stage.
 */
struct RepositoryDescriptor {
    std::string owner;
    std::string name;
    Visibility visibility = Visibility::Public;
    std::string description;

    /** @return `owner/name`. */
    std::string full_name() const;

    /**
     * @brief Browser URL of the repository under @p web_base.
     *
     * @param web_base Site root such as `https://github.com` (a trailing slash
     *                 is tolerated).
     */
    std::string web_url(const std::string& web_base) const;
};

/// Session owned by the GitHub CLI; authenticated out of band with `gh auth login`.
struct InteractiveSession {
    std::string gh_path;
};

/// Token read from the environment once at startup.
struct BearerToken {
    std::string token;
    std::string source; ///< Name of the environment variable it came from
};

using CredentialContext = std::variant<InteractiveSession, BearerToken>;

struct CommitSpec {
    std::string message;
    std::vector<std::string> paths; ///< Empty means every file in the working tree
};

struct BranchRef {
    std::string name;
    std::optional<std::string> base; ///< Branch this one is cut from
};

struct PullRequestSpec {
    std::string title;
    std::string body;
    BranchRef head;
    BranchRef base;
};

struct PullRequestInfo {
    int number = 0;
    std::string url;
};

/**
 * @brief Final payload of a successful run.
 */
struct WorkflowOutcome {
    std::string repository_url;
    PullRequestInfo pull_request;
};

#endif // MODELS_HPP
