#ifndef GH_BACKEND_HPP
#define GH_BACKEND_HPP

#include <map>
#include <string>
#include <vector>

#include "process_utils.hpp"
#include "remote_backend.hpp"

/**
 * @brief Backend driving the GitHub CLI, which owns authentication.
 */
class GhBackend : public RemoteBackend {
  public:
    GhBackend(BackendConfig cfg, InteractiveSession session);

    const char* name() const override { return "gh"; }
    std::vector<std::string> required_tools() const override;
    const CredentialContext& credential() const override { return credential_; }

    StageResult<std::string> validate_credential() override;
    StageResult<std::string> create_repository(const RepositoryDescriptor& repo) override;
    StageResult<PullRequestInfo> open_pull_request(const RepositoryDescriptor& repo,
                                                   const PullRequestSpec& pr) override;
    std::string push_url(const RepositoryDescriptor& repo) const override;
    std::optional<git::PushCredentials> push_credentials() override;

  private:
    procutil::ProcessResult gh(const std::vector<std::string>& args) const;
    /// Run `gh auth token` once and keep the result for every push.
    bool load_push_credentials(std::string* error);

    BackendConfig cfg_;
    CredentialContext credential_;
    std::map<std::string, std::string> env_;
    std::optional<git::PushCredentials> push_creds_;
};

/**
 * @brief Extract the pull request URL and number from `gh pr create` output.
 *
 * @return The last line containing `/pull/<n>`, or `std::nullopt`.
 */
std::optional<PullRequestInfo> parse_pr_create_output(const std::string& out);

#endif // GH_BACKEND_HPP
