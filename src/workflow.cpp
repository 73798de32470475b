#include "workflow.hpp"

#include <chrono>

#include "branch_publisher.hpp"
#include "content.hpp"
#include "local_sync.hpp"
#include "logger.hpp"
#include "preconditions.hpp"
#include "time_utils.hpp"

namespace {

/// Log the failure of @p stage and hand @p failure back unchanged.
Failure stage_failed(const char* stage, const Failure& failure) {
    log_error("Stage failed", {{"stage", stage},
                               {"kind", failure_kind_name(failure.kind)},
                               {"message", failure.message}});
    return failure;
}

} // namespace

StageResult<std::string> provision_repository(RemoteBackend& backend,
                                              const RepositoryDescriptor& repo, Console& console) {
    console.step("Creating repository " + repo.full_name() + "...");
    log_info("Creating repository", {{"repository", repo.full_name()},
                                     {"visibility", repo.visibility == Visibility::Private
                                                        ? "private"
                                                        : "public"}});
    auto created = backend.create_repository(repo);
    if (!created)
        return stage_failed("provision", created.error());
    console.ok("Repository created: " + created.value());
    return created;
}

StageResult<PullRequestInfo> open_pull_request(RemoteBackend& backend,
                                               const RepositoryDescriptor& repo, Console& console) {
    PullRequestSpec pr = content::pull_request();
    console.step("Creating pull request...");
    log_info("Opening pull request", {{"head", pr.head.name}, {"base", pr.base.name}});
    auto opened = backend.open_pull_request(repo, pr);
    if (!opened)
        return stage_failed("pull-request", opened.error());
    log_info("Pull request opened", {{"number", std::to_string(opened.value().number)},
                                     {"url", opened.value().url}});
    console.ok("Pull request created: " + opened.value().url);
    return opened;
}

StageResult<WorkflowOutcome> run_workflow(const Options& opts, RemoteBackend& backend,
                                          Console& console) {
    auto start = std::chrono::steady_clock::now();

    auto validated = validate_preconditions(opts, backend, console);
    if (!validated)
        return stage_failed("preconditions", validated.error());
    const RepositoryDescriptor& repo = validated.value();

    auto url = provision_repository(backend, repo, console);
    if (!url)
        return url.error();

    LocalSynchronizer sync(opts.workspace, opts.remote.remote_name);
    BranchPublisher publisher(opts.workspace, opts.remote.remote_name, backend);

    console.step("Initializing local repository...");
    auto prepared = sync.prepare(backend.push_url(repo));
    if (!prepared)
        return stage_failed("prepare", prepared.error());
    auto initial = sync.record_initial_commit();
    if (!initial)
        return stage_failed("initial-commit", initial.error());
    console.ok("Initial commit created");

    console.step("Pushing " + std::string(content::PRIMARY_BRANCH) + " branch...");
    auto primary = publisher.publish_primary();
    if (!primary)
        return stage_failed("publish-primary", primary.error());
    console.ok("Pushed " + std::string(content::PRIMARY_BRANCH));

    console.step("Creating feature branch...");
    auto feature = publisher.start_feature();
    if (!feature)
        return stage_failed("start-feature", feature.error());
    auto docs = sync.record_documentation_commit();
    if (!docs)
        return stage_failed("documentation-commit", docs.error());
    console.ok("Documentation commit created");

    auto pushed = publisher.publish_feature();
    if (!pushed)
        return stage_failed("publish-feature", pushed.error());
    console.ok("Pushed " + std::string(content::FEATURE_BRANCH));

    auto pr = open_pull_request(backend, repo, console);
    if (!pr)
        return pr.error();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log_info("Bootstrap finished", {{"repository", url.value()},
                                    {"pull_request", pr.value().url},
                                    {"elapsed", format_elapsed(elapsed)}});
    return StageResult<WorkflowOutcome>::success(WorkflowOutcome{url.value(), pr.value()});
}
