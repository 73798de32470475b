#include "api_backend.hpp"

#include <nlohmann/json.hpp>

#include "http_utils.hpp"
#include "logger.hpp"
#include "version.hpp"

using nlohmann::json;

namespace {

/**
 * @brief Decode a REST response, applying the `message` rule.
 *
 * @return The parsed object, or a Failure of @p kind carrying the remote
 *         message (plus any `errors[].message` details) or the transport error.
 */
StageResult<json> decode(const HttpResponse& resp, FailureKind kind, const std::string& what) {
    if (!resp.error.empty())
        return StageResult<json>::failure(kind, what + ": " + resp.error);
    json body = json::parse(resp.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        std::string snippet = resp.body.substr(0, 200);
        return StageResult<json>::failure(kind, what + ": unexpected response (HTTP " +
                                                    std::to_string(resp.status) + "): " + snippet);
    }
    auto msg = body.find("message");
    if (msg == body.end())
        return StageResult<json>::success(std::move(body));
    std::string text = msg->is_string() ? msg->get<std::string>() : msg->dump();
    std::string details;
    auto errors = body.find("errors");
    if (errors != body.end() && errors->is_array()) {
        for (const auto& e : *errors) {
            if (!e.is_object() || !e.contains("message") || !e["message"].is_string())
                continue;
            if (!details.empty())
                details += "; ";
            details += e["message"].get<std::string>();
        }
    }
    if (!details.empty())
        text += " (" + details + ")";
    if (kind == FailureKind::RemoteError && resp.status == 422 &&
        details.find("already exists") != std::string::npos)
        kind = FailureKind::AlreadyExists;
    return StageResult<json>::failure(kind, text);
}

} // namespace

ApiBackend::ApiBackend(BackendConfig cfg, BearerToken token)
    : cfg_(std::move(cfg)), credential_(std::move(token)) {
    add_log_secret(this->token().token);
}

const BearerToken& ApiBackend::token() const { return std::get<BearerToken>(credential_); }

std::vector<std::string> ApiBackend::required_tools() const { return {cfg_.git_path}; }

std::vector<std::string> ApiBackend::headers(bool with_body) const {
    std::vector<std::string> h{"Authorization: Bearer " + token().token,
                               "Accept: application/vnd.github+json",
                               "X-GitHub-Api-Version: 2022-11-28",
                               std::string("User-Agent: ") + REPOBOOTSTRAP_USER_AGENT};
    if (with_body)
        h.emplace_back("Content-Type: application/json");
    return h;
}

StageResult<std::string> ApiBackend::validate_credential() {
    if (token().token.empty())
        return StageResult<std::string>::failure(FailureKind::InvalidCredential,
                                                 token().source + " not set");
    HttpResponse resp = http_request("GET", cfg_.api_url + "/user", headers(false), {}, cfg_.timeout);
    auto decoded = decode(resp, FailureKind::InvalidCredential, "GET /user");
    if (!decoded)
        return decoded.error();
    const json& body = decoded.value();
    auto login = body.find("login");
    if (login == body.end() || !login->is_string())
        return StageResult<std::string>::failure(FailureKind::InvalidCredential,
                                                 "GET /user: response has no login: " +
                                                     resp.body.substr(0, 200));
    login_ = login->get<std::string>();
    log_info("Token validated", {{"login", login_}, {"source", token().source}});
    return StageResult<std::string>::success(login_);
}

StageResult<std::string> ApiBackend::create_repository(const RepositoryDescriptor& repo) {
    if (!login_.empty() && login_ != repo.owner)
        log_warning("Repository owner differs from the authenticated user",
                    {{"owner", repo.owner}, {"login", login_}});
    json payload{{"name", repo.name},
                 {"description", repo.description},
                 {"homepage", repo.web_url(cfg_.web_url)},
                 {"private", repo.visibility == Visibility::Private},
                 {"has_issues", true},
                 {"has_projects", true},
                 {"has_wiki", false},
                 {"auto_init", false}};
    HttpResponse resp =
        http_request("POST", cfg_.api_url + "/user/repos", headers(true), payload.dump(), cfg_.timeout);
    auto decoded = decode(resp, FailureKind::RemoteError, "POST /user/repos");
    if (!decoded)
        return decoded.error();
    auto url = decoded.value().find("html_url");
    if (url == decoded.value().end() || !url->is_string())
        return StageResult<std::string>::failure(FailureKind::RemoteError,
                                                 "POST /user/repos: response has no html_url");
    return StageResult<std::string>::success(url->get<std::string>());
}

StageResult<PullRequestInfo> ApiBackend::open_pull_request(const RepositoryDescriptor& repo,
                                                           const PullRequestSpec& pr) {
    json payload{{"title", pr.title}, {"body", pr.body}, {"head", pr.head.name},
                 {"base", pr.base.name}};
    std::string path = "/repos/" + repo.full_name() + "/pulls";
    HttpResponse resp =
        http_request("POST", cfg_.api_url + path, headers(true), payload.dump(), cfg_.timeout);
    auto decoded = decode(resp, FailureKind::RemoteError, "POST " + path);
    if (!decoded)
        return decoded.error();
    const json& body = decoded.value();
    auto number = body.find("number");
    auto url = body.find("html_url");
    if (number == body.end() || !number->is_number_integer() || url == body.end() ||
        !url->is_string())
        return StageResult<PullRequestInfo>::failure(FailureKind::RemoteError,
                                                     "POST " + path +
                                                         ": response has no number/html_url");
    return StageResult<PullRequestInfo>::success(
        PullRequestInfo{number->get<int>(), url->get<std::string>()});
}

std::string ApiBackend::push_url(const RepositoryDescriptor& repo) const {
    std::string url = repo.web_url(cfg_.web_url) + ".git";
    if (cfg_.embed_token)
        return with_userinfo(url, token().token);
    return url;
}

std::optional<git::PushCredentials> ApiBackend::push_credentials() {
    if (cfg_.embed_token)
        return std::nullopt;
    return git::PushCredentials{"x-access-token", token().token};
}

std::vector<std::string> ApiBackend::closing_notes(const RepositoryDescriptor& repo,
                                                   const std::string& remote_name) const {
    if (!cfg_.embed_token)
        return {};
    return {"Note: Token is stored in .git/config remote URL",
            "To remove: git remote set-url " + remote_name + " git@" + url_host(cfg_.web_url) +
                ":" + repo.full_name() + ".git"};
}
