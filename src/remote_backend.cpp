#include "remote_backend.hpp"

#include "api_backend.hpp"
#include "gh_backend.hpp"

BackendConfig backend_config_from(const Options& opts) {
    BackendConfig cfg;
    cfg.api_url = opts.remote.api_url;
    cfg.web_url = opts.remote.web_url;
    while (!cfg.web_url.empty() && cfg.web_url.back() == '/')
        cfg.web_url.pop_back();
    cfg.gh_path = opts.remote.gh_path;
    cfg.git_path = opts.remote.git_path;
    cfg.timeout = opts.remote.timeout;
    cfg.embed_token = opts.remote.embed_token;
    return cfg;
}

std::unique_ptr<RemoteBackend> make_backend(BackendKind kind, const Options& opts,
                                            const std::optional<std::string>& token) {
    BackendConfig cfg = backend_config_from(opts);
    if (kind == BackendKind::Api)
        return std::make_unique<ApiBackend>(cfg, BearerToken{token.value_or(""),
                                                             opts.remote.token_env});
    return std::make_unique<GhBackend>(cfg, InteractiveSession{cfg.gh_path});
}

std::string url_host(const std::string& url) {
    size_t start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;
    size_t at = url.find('@', start);
    size_t end = url.find('/', start);
    if (at != std::string::npos && (end == std::string::npos || at < end))
        start = at + 1;
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string with_userinfo(const std::string& url, const std::string& userinfo) {
    size_t pos = url.find("://");
    if (pos == std::string::npos)
        return userinfo + "@" + url;
    return url.substr(0, pos + 3) + userinfo + "@" + url.substr(pos + 3);
}
