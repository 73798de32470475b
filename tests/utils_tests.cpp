#include "test_common.hpp"
#include "remote_backend.hpp"
#include <cstdint>
#include <regex>
#include <sstream>

TEST_CASE("parse_size_t bounds") {
    bool ok = false;
    REQUIRE(parse_size_t("5", 1, 100, ok) == 5);
    REQUIRE(ok);
    parse_size_t("0", 1, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("101", 1, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("7x", 0, 100, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2K", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(parse_bytes("3kb", 0, SIZE_MAX, ok) == 3072);
    REQUIRE(parse_bytes("1MB", 0, SIZE_MAX, ok) == 1024 * 1024);
    REQUIRE(parse_bytes("1g", 0, SIZE_MAX, ok) == 1024ull * 1024 * 1024);
    REQUIRE(parse_bytes("10b", 0, SIZE_MAX, ok) == 10);
    parse_bytes("1T", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("2K", 0, 1000, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration suffixes") {
    bool ok = false;
    REQUIRE(parse_duration("30", 3600, ok) == std::chrono::seconds(30));
    REQUIRE(ok);
    REQUIRE(parse_duration("45s", 3600, ok) == std::chrono::seconds(45));
    REQUIRE(parse_duration("2m", 3600, ok) == std::chrono::seconds(120));
    REQUIRE(parse_duration("1h", 3600, ok) == std::chrono::seconds(3600));
    parse_duration("2h", 3600, ok);
    REQUIRE_FALSE(ok);
    parse_duration("abc", 3600, ok);
    REQUIRE_FALSE(ok);
    parse_duration("", 3600, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool spellings") {
    bool ok = false;
    REQUIRE(parse_bool("true", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("YES", ok));
    REQUIRE(parse_bool("on", ok));
    REQUIRE(parse_bool("1", ok));
    REQUIRE(parse_bool("", ok));
    REQUIRE(ok);
    REQUIRE_FALSE(parse_bool("false", ok));
    REQUIRE(ok);
    REQUIRE_FALSE(parse_bool("off", ok));
    REQUIRE_FALSE(parse_bool("0", ok));
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("format_elapsed ranges") {
    using std::chrono::milliseconds;
    REQUIRE(format_elapsed(milliseconds(850)) == "850ms");
    REQUIRE(format_elapsed(milliseconds(4200)) == "4.2s");
    REQUIRE(format_elapsed(milliseconds(65000)) == "1m05s");
    REQUIRE(format_elapsed(milliseconds(-5)) == "0ms");
}

TEST_CASE("timestamp format") {
    std::regex re(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    REQUIRE(std::regex_match(timestamp(), re));
}

TEST_CASE("StageResult carries value or failure") {
    auto ok = StageResult<int>::success(7);
    REQUIRE(ok.ok());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok.value() == 7);

    auto bad = StageResult<int>::failure(FailureKind::PushError, "rejected");
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.error().kind == FailureKind::PushError);
    REQUIRE(bad.error().message == "rejected");

    StageResult<std::string> forwarded = bad.error();
    REQUIRE_FALSE(forwarded);
    REQUIRE(forwarded.error().kind == FailureKind::PushError);
}

TEST_CASE("describe formats one diagnostic line") {
    REQUIRE(describe({FailureKind::MissingArtifact, "test_smoke.csv not found"}) ==
            "Error [MissingArtifact]: test_smoke.csv not found");
    REQUIRE(std::string(failure_kind_name(FailureKind::AlreadyExists)) == "AlreadyExists");
    REQUIRE(std::string(failure_kind_name(FailureKind::NotAuthenticated)) == "NotAuthenticated");
}

TEST_CASE("RepositoryDescriptor derived names") {
    RepositoryDescriptor repo{"acme", "demo-pipeline", Visibility::Public, "d"};
    REQUIRE(repo.full_name() == "acme/demo-pipeline");
    REQUIRE(repo.web_url("https://github.com") == "https://github.com/acme/demo-pipeline");
    REQUIRE(repo.web_url("https://github.com/") == "https://github.com/acme/demo-pipeline");
}

TEST_CASE("URL helpers") {
    REQUIRE(url_host("https://github.com/acme") == "github.com");
    REQUIRE(url_host("https://tok@git.example.com:8443/x") == "git.example.com:8443");
    REQUIRE(url_host("http://127.0.0.1:9000") == "127.0.0.1:9000");
    REQUIRE(with_userinfo("https://github.com/a/b.git", "tok") == "https://tok@github.com/a/b.git");
}

TEST_CASE("Required artifacts are fixed and ordered") {
    REQUIRE(content::required_paths() ==
            std::vector<std::string>{"README.md", "analyze.py", "requirements.txt",
                                     "test_smoke.csv", ".github/workflows/ci.yml"});
}

TEST_CASE("Pull request body lists exactly the required artifacts") {
    PullRequestSpec pr = content::pull_request();
    REQUIRE(pr.head.name == "feature/prototype-pipeline");
    REQUIRE(pr.base.name == "main");
    REQUIRE(pr.title == "Add Integer Resonance CRISPR analysis pipeline");

    std::vector<std::string> listed;
    std::regex item(R"(^- \*\*`([^`]+)`\*\*:)");
    std::istringstream in(pr.body);
    std::string line;
    while (std::getline(in, line)) {
        std::smatch m;
        if (std::regex_search(line, m, item))
            listed.push_back(m[1].str());
    }
    REQUIRE(listed == content::required_paths());
}

TEST_CASE("Commit specs and branches") {
    CommitSpec initial = content::initial_commit();
    REQUIRE(initial.paths.empty());
    for (const auto& path : content::required_paths())
        REQUIRE(initial.message.find("- Add " + path + ":") != std::string::npos);
    REQUIRE(initial.message.rfind("Initial commit: Integer Resonance CRISPR with CI smoke test\n\n"
                                  "- Add analyze.py: Integer Resonance scoring algorithm\n"
                                  "- Add requirements.txt: Python dependencies\n",
                                  0) == 0);
    REQUIRE(initial.message.find("- Add .github/workflows/ci.yml: CI pipeline with smoke tests\n") !=
            std::string::npos);
    CommitSpec docs = content::documentation_commit();
    REQUIRE(docs.paths == std::vector<std::string>{"README.md"});
    REQUIRE(content::readme_development_section().find("## Development") != std::string::npos);
    REQUIRE_FALSE(content::primary_branch().base.has_value());
    REQUIRE(content::feature_branch().base == std::optional<std::string>("main"));
}
