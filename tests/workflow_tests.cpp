#include "test_common.hpp"
#include "console.hpp"
#include "local_sync.hpp"
#include "preconditions.hpp"
#include "remote_backend.hpp"
#include "workflow.hpp"
#include <algorithm>
#include <sstream>

namespace {

struct Scenario {
    fs::path workspace;
    fs::path remote;
    Options opts;
    std::ostringstream out;
    std::ostringstream err;
    Console console{out, err, false, false};

    explicit Scenario(const std::string& name) {
        workspace = rbt::make_workspace(name + "_ws");
        remote = fs::temp_directory_path() / (name + "_remote.git");
        FS_REMOVE_ALL(remote);
        opts.positional = {"acme", "demo-pipeline"};
        opts.workspace = workspace;
        opts.description = content::default_description();
    }

    ~Scenario() {
        std::error_code ec;
        fs::remove_all(workspace, ec);
        fs::remove_all(remote, ec);
    }
};

} // namespace

TEST_CASE("Preconditions reject a wrong argument count before anything else") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_args");
    Scenario s("rb_wf_args");
    rbt::FakeBackend backend(s.remote);
    backend.tools = {"rb-missing-tool"};
    for (auto args : {std::vector<std::string>{}, std::vector<std::string>{"acme"},
                      std::vector<std::string>{"acme", "demo", "extra"},
                      std::vector<std::string>{"acme", ""}}) {
        s.opts.positional = args;
        auto res = run_workflow(s.opts, backend, s.console);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == FailureKind::ArgumentError);
    }
    REQUIRE(backend.calls() == 0);
    REQUIRE_FALSE(git::is_git_repo(s.workspace));
    REQUIRE_FALSE(fs::exists(s.remote));
}

TEST_CASE("Preconditions report a missing tool") {
    git::GitInitGuard guard;
    Scenario s("rb_wf_tool");
    rbt::FakeBackend backend(s.remote);
    backend.tools = {"sh", "rb-missing-tool"};
    auto res = validate_preconditions(s.opts, backend, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::MissingTool);
    REQUIRE(res.error().message.find("rb-missing-tool") != std::string::npos);
    REQUIRE(backend.calls() == 0);
}

TEST_CASE("Missing smoke test dataset fails before any network call") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_artifact");
    Scenario s("rb_wf_artifact");
    FS_REMOVE(s.workspace / "test_smoke.csv");
    rbt::FakeBackend backend(s.remote);
    auto res = run_workflow(s.opts, backend, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::MissingArtifact);
    REQUIRE(res.error().message.find("test_smoke.csv") != std::string::npos);
    REQUIRE(backend.calls() == 0);
    REQUIRE_FALSE(fs::exists(s.remote));
    REQUIRE_FALSE(git::is_git_repo(s.workspace));
}

TEST_CASE("Artifacts must be regular files") {
    git::GitInitGuard guard;
    Scenario s("rb_wf_artifact_dir");
    FS_REMOVE(s.workspace / "analyze.py");
    fs::create_directories(s.workspace / "analyze.py");
    rbt::FakeBackend backend(s.remote);
    auto res = validate_preconditions(s.opts, backend, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::MissingArtifact);
    REQUIRE(res.error().message.find("analyze.py") != std::string::npos);
}

TEST_CASE("Unauthenticated session stops the run with a hint") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_auth");
    Scenario s("rb_wf_auth");
    rbt::FakeBackend backend(s.remote);
    backend.authenticated = false;
    auto res = run_workflow(s.opts, backend, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::NotAuthenticated);
    REQUIRE(backend.create_calls == 0);
    REQUIRE(s.out.str().find("gh auth login") != std::string::npos);
}

TEST_CASE("Missing identity is reported after the credential check") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_identity", false);
    Scenario s("rb_wf_identity");
    rbt::FakeBackend backend(s.remote);
    auto res = run_workflow(s.opts, backend, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::MissingIdentity);
    REQUIRE(backend.validate_calls == 1);
    REQUIRE(backend.create_calls == 0);
    REQUIRE(s.out.str().find("git config --global user.name") != std::string::npos);
}

TEST_CASE("Full run creates one repository, two branches and one pull request") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_full");
    Scenario s("rb_wf_full");
    rbt::FakeBackend backend(s.remote);
    auto res = run_workflow(s.opts, backend, s.console);
    INFO(s.err.str());
    if (!res)
        INFO(describe(res.error()));
    REQUIRE(res);
    REQUIRE(res.value().repository_url == "https://github.com/acme/demo-pipeline");
    REQUIRE(res.value().pull_request.number >= 1);
    REQUIRE(res.value().pull_request.url == "https://github.com/acme/demo-pipeline/pull/1");

    REQUIRE(backend.validate_calls == 1);
    REQUIRE(backend.create_calls == 1);
    REQUIRE(backend.pr_calls == 1);
    REQUIRE(backend.created->visibility == Visibility::Public);
    REQUIRE(backend.opened[0].head.name == "feature/prototype-pipeline");
    REQUIRE(backend.opened[0].base.name == "main");

    auto main_tip = git::resolve_ref(s.remote, "refs/heads/main");
    auto feature_tip = git::resolve_ref(s.remote, "refs/heads/feature/prototype-pipeline");
    REQUIRE(main_tip);
    REQUIRE(feature_tip);
    REQUIRE(main_tip == git::resolve_ref(s.workspace, "main"));
    REQUIRE(feature_tip == git::resolve_ref(s.workspace, "feature/prototype-pipeline"));
    REQUIRE(git::resolve_ref(s.workspace, "feature/prototype-pipeline~1") == main_tip);

    auto initial = git::changed_paths(s.workspace, "main");
    for (const auto& path : content::required_paths())
        REQUIRE(std::find(initial.begin(), initial.end(), path) != initial.end());
    REQUIRE(git::changed_paths(s.workspace, "feature/prototype-pipeline") ==
            std::vector<std::string>{"README.md"});
    REQUIRE(rbt::read_file(s.workspace / "README.md").find("## Development") != std::string::npos);

    REQUIRE(git::get_current_branch(s.workspace).value_or("") == "feature/prototype-pipeline");
    REQUIRE(git::get_remote_url(s.workspace, "origin").value_or("") == s.remote.string());
    REQUIRE(git::get_upstream(s.workspace, "main").value_or("") == "origin/main");
    REQUIRE(git::get_upstream(s.workspace, "feature/prototype-pipeline").value_or("") ==
            "origin/feature/prototype-pipeline");
}

TEST_CASE("Existing repository fails with AlreadyExists and changes nothing") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_exists");
    Scenario s("rb_wf_exists");
    rbt::FakeBackend first(s.remote);
    REQUIRE(run_workflow(s.opts, first, s.console));
    auto remote_main = git::resolve_ref(s.remote, "refs/heads/main");
    auto local_head = git::resolve_ref(s.workspace, "HEAD");
    std::string readme = rbt::read_file(s.workspace / "README.md");

    rbt::FakeBackend second(s.remote);
    auto res = run_workflow(s.opts, second, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::AlreadyExists);
    REQUIRE(second.create_calls == 1);
    REQUIRE(second.pr_calls == 0);
    REQUIRE(git::resolve_ref(s.remote, "refs/heads/main") == remote_main);
    REQUIRE(git::resolve_ref(s.workspace, "HEAD") == local_head);
    REQUIRE(rbt::read_file(s.workspace / "README.md") == readme);
}

TEST_CASE("Push failure is reported as PushError without rollback") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_push");
    Scenario s("rb_wf_push");

    class UnreachableBackend : public rbt::FakeBackend {
      public:
        using rbt::FakeBackend::FakeBackend;
        std::string push_url(const RepositoryDescriptor&) const override {
            return (fs::temp_directory_path() / "rb_wf_push_nowhere" / "repo.git").string();
        }
    } backend(s.remote);
    auto res = run_workflow(s.opts, backend, s.console);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::PushError);
    REQUIRE(backend.create_calls == 1);
    REQUIRE(backend.pr_calls == 0);
    REQUIRE(fs::exists(s.remote));
    REQUIRE(git::resolve_ref(s.workspace, "main"));
}

TEST_CASE("LocalSynchronizer rebinding is idempotent") {
    git::GitInitGuard guard;
    rbt::IdentityScope identity("rb_wf_sync");
    fs::path ws = rbt::make_workspace("rb_wf_sync_ws");
    LocalSynchronizer sync(ws, "origin");
    REQUIRE(sync.prepare("https://github.com/acme/one.git"));
    REQUIRE(sync.prepare("https://github.com/acme/two.git"));
    REQUIRE(git::get_remote_url(ws, "origin").value_or("") == "https://github.com/acme/two.git");
    REQUIRE(sync.record_initial_commit());
    auto again = sync.record_initial_commit();
    REQUIRE_FALSE(again);
    REQUIRE(again.error().kind == FailureKind::VcsError);
    FS_REMOVE_ALL(ws);
}
