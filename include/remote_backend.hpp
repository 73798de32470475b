#ifndef REMOTE_BACKEND_HPP
#define REMOTE_BACKEND_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "git_utils.hpp"
#include "models.hpp"
#include "options.hpp"
#include "stage_result.hpp"

/**
 * @brief Settings shared by both backends, taken from Options.
 */
struct BackendConfig {
    std::string api_url = "https://api.github.com";
    std::string web_url = "https://github.com";
    std::string gh_path = "gh";
    std::string git_path = "git";
    std::chrono::seconds timeout{0};
    bool embed_token = true;
};

BackendConfig backend_config_from(const Options& opts);

/**
 * @brief Access to the hosting platform.
 *
 * The workflow only talks to the platform through this interface. Each call
 * is made at most once per run and none is retried.
 */
class RemoteBackend {
  public:
    virtual ~RemoteBackend() = default;

    /// Short name used in logs ("gh", "api").
    virtual const char* name() const = 0;

    /// Executables that must be resolvable before anything else runs.
    virtual std::vector<std::string> required_tools() const = 0;

    virtual const CredentialContext& credential() const = 0;

    /**
     * @brief Check that the credential can act on the platform.
     *
     * @return A description of the authenticated account on success;
     *         InvalidCredential or NotAuthenticated otherwise.
     */
    virtual StageResult<std::string> validate_credential() = 0;

    /**
     * @brief Create the remote repository.
     *
     * @return Browser URL of the new repository; AlreadyExists or RemoteError
     *         on failure.
     */
    virtual StageResult<std::string> create_repository(const RepositoryDescriptor& repo) = 0;

    /**
     * @brief Open a pull request on @p repo.
     *
     * @return Number and URL of the pull request; RemoteError on failure.
     */
    virtual StageResult<PullRequestInfo> open_pull_request(const RepositoryDescriptor& repo,
                                                           const PullRequestSpec& pr) = 0;

    /// URL stored as the remote of the local workspace.
    virtual std::string push_url(const RepositoryDescriptor& repo) const = 0;

    /// Credentials handed to libgit2 when a push needs them.
    virtual std::optional<git::PushCredentials> push_credentials() = 0;

    /// Lines shown to the operator after a successful run.
    virtual std::vector<std::string> closing_notes(const RepositoryDescriptor& repo,
                                                   const std::string& remote_name) const {
        (void)repo;
        (void)remote_name;
        return {};
    }
};

/**
 * @brief Build the backend selected by @p kind.
 *
 * @param kind  BackendKind::Gh or BackendKind::Api (Auto must be resolved).
 * @param token Value of the token variable, if set. Only the api backend
 *              uses it.
 */
std::unique_ptr<RemoteBackend> make_backend(BackendKind kind, const Options& opts,
                                            const std::optional<std::string>& token);

/** @return Host part of @p url (`https://github.com/x` -> `github.com`). */
std::string url_host(const std::string& url);

/** @return @p url with `userinfo@` inserted after the scheme. */
std::string with_userinfo(const std::string& url, const std::string& userinfo);

#endif // REMOTE_BACKEND_HPP
