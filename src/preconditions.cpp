#include "preconditions.hpp"

#include <filesystem>

#include "content.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "process_utils.hpp"

namespace fs = std::filesystem;

namespace {

StageResult<Unit> check_tools(const RemoteBackend& backend, Console& console) {
    for (const auto& tool : backend.required_tools()) {
        auto found = procutil::find_executable(tool);
        if (!found)
            return StageResult<Unit>::failure(FailureKind::MissingTool, tool + " is not installed");
        log_debug("Found tool", {{"tool", tool}, {"path", *found}});
        console.item(tool);
    }
    return StageResult<Unit>::success({});
}

StageResult<Unit> check_artifacts(const fs::path& workspace, Console& console) {
    for (const auto& path : content::required_paths()) {
        std::error_code ec;
        if (!fs::is_regular_file(workspace / path, ec))
            return StageResult<Unit>::failure(FailureKind::MissingArtifact, path + " not found");
        console.item(path);
    }
    return StageResult<Unit>::success({});
}

} // namespace

StageResult<RepositoryDescriptor> repository_from_arguments(const Options& opts) {
    const auto& pos = opts.positional;
    if (pos.size() != 2)
        return StageResult<RepositoryDescriptor>::failure(
            FailureKind::ArgumentError, "expected OWNER and REPO_NAME, got " +
                                            std::to_string(pos.size()) + " argument(s)");
    if (pos[0].empty() || pos[1].empty())
        return StageResult<RepositoryDescriptor>::failure(FailureKind::ArgumentError,
                                                          "OWNER and REPO_NAME must not be empty");
    RepositoryDescriptor repo;
    repo.owner = pos[0];
    repo.name = pos[1];
    repo.visibility = opts.visibility;
    repo.description = opts.description;
    return StageResult<RepositoryDescriptor>::success(repo);
}

StageResult<RepositoryDescriptor> validate_preconditions(const Options& opts,
                                                         RemoteBackend& backend, Console& console) {
    auto repo = repository_from_arguments(opts);
    if (!repo)
        return repo;
    log_info("Validating preconditions",
             {{"repository", repo.value().full_name()}, {"backend", backend.name()}});

    console.step("Checking prerequisites...");
    auto tools = check_tools(backend, console);
    if (!tools)
        return tools.error();

    console.step("Checking required files...");
    auto artifacts = check_artifacts(opts.workspace, console);
    if (!artifacts)
        return artifacts.error();

    console.step("Verifying GitHub credentials...");
    auto account = backend.validate_credential();
    if (!account) {
        if (account.error().kind == FailureKind::NotAuthenticated)
            console.note("Run: gh auth login");
        return account.error();
    }
    console.ok("Authenticated as: " + account.value());

    std::string err;
    auto identity = git::configured_identity(opts.workspace, &err);
    if (!identity) {
        console.note("Configure it with:");
        console.note("  git config --global user.name \"Your Name\"");
        console.note("  git config --global user.email \"you@example.com\"");
        return StageResult<RepositoryDescriptor>::failure(FailureKind::MissingIdentity, err);
    }
    log_debug("Commit identity", {{"name", identity->name}, {"email", identity->email}});
    console.ok("All prerequisites met");
    return repo;
}
