#include "gh_backend.hpp"

#include <cctype>
#include <sstream>

#include "logger.hpp"

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::string failure_text(const procutil::ProcessResult& res) {
    std::string text = trim(res.err);
    if (text.empty())
        text = trim(res.out);
    if (text.empty())
        text = "exit status " + std::to_string(res.exit_code);
    return text;
}

} // namespace

std::optional<PullRequestInfo> parse_pr_create_output(const std::string& out) {
    std::optional<PullRequestInfo> found;
    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        size_t scheme = line.find("http");
        size_t pull = line.rfind("/pull/");
        if (scheme == std::string::npos || pull == std::string::npos || pull < scheme)
            continue;
        std::string digits;
        for (size_t i = pull + 6; i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]));
             ++i)
            digits += line[i];
        if (digits.empty() || digits.size() > 9)
            continue;
        std::string url = line.substr(scheme, pull + 6 + digits.size() - scheme);
        found = PullRequestInfo{std::stoi(digits), url};
    }
    return found;
}

GhBackend::GhBackend(BackendConfig cfg, InteractiveSession session)
    : cfg_(std::move(cfg)), credential_(std::move(session)) {
    env_["GH_PROMPT_DISABLED"] = "1";
    env_["NO_COLOR"] = "1";
    std::string host = url_host(cfg_.web_url);
    if (!host.empty() && host != "github.com")
        env_["GH_HOST"] = host;
}

std::vector<std::string> GhBackend::required_tools() const { return {cfg_.gh_path, cfg_.git_path}; }

procutil::ProcessResult GhBackend::gh(const std::vector<std::string>& args) const {
    std::string cmd = args.empty() ? "" : args.front();
    if (args.size() > 1)
        cmd += " " + args[1];
    log_debug("Running gh", {{"command", cmd}});
    auto res = procutil::run_process(std::get<InteractiveSession>(credential_).gh_path, args, {},
                                     env_);
    log_debug("gh finished", {{"command", cmd}, {"exit", std::to_string(res.exit_code)}});
    return res;
}

StageResult<std::string> GhBackend::validate_credential() {
    auto res = gh({"auth", "status"});
    if (!res.ok())
        return StageResult<std::string>::failure(FailureKind::NotAuthenticated,
                                                 "gh is not authenticated: " + failure_text(res));
    // libgit2 has no access to gh's credential helper; pushes need the token itself.
    std::string err;
    if (!load_push_credentials(&err))
        return StageResult<std::string>::failure(FailureKind::NotAuthenticated,
                                                 "gh auth token printed no token: " + err);
    log_info("GitHub CLI session is authenticated");
    return StageResult<std::string>::success("GitHub CLI session");
}

StageResult<std::string> GhBackend::create_repository(const RepositoryDescriptor& repo) {
    const std::string full = repo.full_name();
    if (gh({"repo", "view", full}).ok())
        return StageResult<std::string>::failure(FailureKind::AlreadyExists,
                                                 "Repository " + full + " already exists");
    std::vector<std::string> args{"repo", "create", full,
                                  repo.visibility == Visibility::Private ? "--private" : "--public",
                                  "--description", repo.description, "--disable-wiki"};
    auto res = gh(args);
    if (!res.ok())
        return StageResult<std::string>::failure(FailureKind::RemoteError, failure_text(res));
    return StageResult<std::string>::success(repo.web_url(cfg_.web_url));
}

StageResult<PullRequestInfo> GhBackend::open_pull_request(const RepositoryDescriptor& repo,
                                                          const PullRequestSpec& pr) {
    auto res = gh({"pr", "create", "--repo", repo.full_name(), "--title", pr.title, "--body",
                   pr.body, "--base", pr.base.name, "--head", pr.head.name});
    if (!res.ok())
        return StageResult<PullRequestInfo>::failure(FailureKind::RemoteError, failure_text(res));
    auto info = parse_pr_create_output(res.out);
    if (!info)
        return StageResult<PullRequestInfo>::failure(
            FailureKind::RemoteError, "gh pr create printed no pull request URL: " + trim(res.out));
    return StageResult<PullRequestInfo>::success(*info);
}

std::string GhBackend::push_url(const RepositoryDescriptor& repo) const {
    return repo.web_url(cfg_.web_url) + ".git";
}

bool GhBackend::load_push_credentials(std::string* error) {
    if (push_creds_)
        return true;
    auto res = gh({"auth", "token"});
    std::string token = trim(res.out);
    if (!res.ok() || token.empty()) {
        if (error)
            *error = failure_text(res);
        return false;
    }
    add_log_secret(token);
    push_creds_ = git::PushCredentials{"x-access-token", token};
    return true;
}

std::optional<git::PushCredentials> GhBackend::push_credentials() {
    std::string err;
    if (!load_push_credentials(&err))
        log_warning("gh auth token returned no token", {{"error", err}});
    return push_creds_;
}
