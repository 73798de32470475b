#include "branch_publisher.hpp"

#include "content.hpp"
#include "git_utils.hpp"
#include "logger.hpp"

BranchPublisher::BranchPublisher(std::filesystem::path workspace, std::string remote_name,
                                 RemoteBackend& backend)
    : workspace_(std::move(workspace)), remote_name_(std::move(remote_name)), backend_(backend) {}

StageResult<Unit> BranchPublisher::publish(const BranchRef& branch) {
    auto creds = backend_.push_credentials();
    std::string err;
    auto tip = git::resolve_ref(workspace_, branch.name, &err);
    if (!tip)
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    log_info("Pushing branch",
             {{"branch", branch.name}, {"remote", remote_name_}, {"commit", tip->substr(0, 7)}});
    if (!git::push_branch(workspace_, remote_name_, branch.name, creds ? &*creds : nullptr, &err))
        return StageResult<Unit>::failure(FailureKind::PushError, err);
    if (!git::set_upstream(workspace_, branch.name, remote_name_, &err))
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    auto upstream = git::get_upstream(workspace_, branch.name);
    if (!upstream || *upstream != remote_name_ + "/" + branch.name)
        return StageResult<Unit>::failure(FailureKind::VcsError,
                                          "upstream of " + branch.name + " not recorded");
    log_debug("Upstream set", {{"branch", branch.name}, {"upstream", *upstream}});
    return StageResult<Unit>::success({});
}

StageResult<Unit> BranchPublisher::publish_primary() {
    BranchRef primary = content::primary_branch();
    std::string err;
    auto current = git::get_current_branch(workspace_, &err);
    if (!current)
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    if (*current != primary.name)
        log_info("Renaming branch", {{"from", *current}, {"to", primary.name}});
    if (!git::rename_current_branch(workspace_, primary.name, &err))
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    return publish(primary);
}

StageResult<Unit> BranchPublisher::start_feature() {
    BranchRef feature = content::feature_branch();
    std::string err;
    if (!git::create_branch(workspace_, feature.name, feature.base.value_or(content::PRIMARY_BRANCH),
                            &err) ||
        !git::checkout_branch(workspace_, feature.name, &err))
        return StageResult<Unit>::failure(FailureKind::VcsError, err);
    log_info("Switched to branch", feature.name);
    return StageResult<Unit>::success({});
}

StageResult<Unit> BranchPublisher::publish_feature() { return publish(content::feature_branch()); }
