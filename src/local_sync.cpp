#include "local_sync.hpp"

#include <fstream>

#include "content.hpp"
#include "git_utils.hpp"
#include "logger.hpp"

LocalSynchronizer::LocalSynchronizer(std::filesystem::path workspace, std::string remote_name)
    : workspace_(std::move(workspace)), remote_name_(std::move(remote_name)) {}

StageResult<Unit> LocalSynchronizer::prepare(const std::string& url) {
    std::string err;
    bool fresh = !git::is_git_repo(workspace_);
    if (!git::open_or_init(workspace_, &err))
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    if (fresh)
        log_info("Initialized repository", workspace_.string());
    auto previous = git::get_remote_url(workspace_, remote_name_);
    if (previous && *previous != url)
        log_info("Replacing remote", {{"remote", remote_name_}, {"previous", *previous}});
    if (!git::bind_remote(workspace_, remote_name_, url, &err))
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    log_info("Bound remote", {{"remote", remote_name_}, {"url", url}});
    return StageResult<Unit>::success({});
}

StageResult<std::string> LocalSynchronizer::commit(const CommitSpec& spec) {
    std::string err;
    auto oid = git::commit_paths(workspace_, spec.paths, spec.message, &err);
    if (!oid)
        return StageResult<std::string>::failure(FailureKind::VcsError, err);
    auto files = git::changed_paths(workspace_, *oid);
    log_info("Created commit", {{"commit", oid->substr(0, 7)},
                                {"files", std::to_string(files.size())},
                                {"subject", spec.message.substr(0, spec.message.find('\n'))}});
    return StageResult<std::string>::success(*oid);
}

StageResult<std::string> LocalSynchronizer::record_initial_commit() {
    return commit(content::initial_commit());
}

StageResult<std::string> LocalSynchronizer::record_documentation_commit() {
    auto readme = workspace_ / content::README_PATH;
    std::ofstream out(readme, std::ios::app | std::ios::binary);
    if (!out)
        return StageResult<std::string>::failure(FailureKind::VcsError,
                                                 "cannot open " + readme.string());
    out << content::readme_development_section();
    out.close();
    if (!out)
        return StageResult<std::string>::failure(FailureKind::VcsError,
                                                 "cannot write " + readme.string());
    return commit(content::documentation_commit());
}
