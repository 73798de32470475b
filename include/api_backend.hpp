#ifndef API_BACKEND_HPP
#define API_BACKEND_HPP

#include <string>
#include <vector>

#include "remote_backend.hpp"

/**
 * @brief Backend talking to the GitHub REST API with a bearer token.
 *
 * Every response is parsed as JSON; a `message` member marks a failure
 * whatever the HTTP status.
 */
class ApiBackend : public RemoteBackend {
  public:
    ApiBackend(BackendConfig cfg, BearerToken token);

    const char* name() const override { return "api"; }
    std::vector<std::string> required_tools() const override;
    const CredentialContext& credential() const override { return credential_; }

    StageResult<std::string> validate_credential() override;
    StageResult<std::string> create_repository(const RepositoryDescriptor& repo) override;
    StageResult<PullRequestInfo> open_pull_request(const RepositoryDescriptor& repo,
                                                   const PullRequestSpec& pr) override;
    std::string push_url(const RepositoryDescriptor& repo) const override;
    std::optional<git::PushCredentials> push_credentials() override;
    std::vector<std::string> closing_notes(const RepositoryDescriptor& repo,
                                           const std::string& remote_name) const override;

    /// Login returned by the last successful validate_credential().
    const std::string& login() const { return login_; }

  private:
    const BearerToken& token() const;
    std::vector<std::string> headers(bool with_body) const;

    BackendConfig cfg_;
    CredentialContext credential_;
    std::string login_;
};

#endif // API_BACKEND_HPP
