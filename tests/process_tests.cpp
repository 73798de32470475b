#include "test_common.hpp"

TEST_CASE("run_process captures stdout, stderr and status") {
    auto res = procutil::run_process("sh", {"-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(res.exit_code == 3);
    REQUIRE_FALSE(res.ok());
    REQUIRE(res.out == "out\n");
    REQUIRE(res.err == "err\n");
}

TEST_CASE("run_process passes arguments verbatim") {
    auto res = procutil::run_process("printf", {"%s|", "two words", "--body", "a\nb"});
    REQUIRE(res.ok());
    REQUIRE(res.out == "two words|--body|a\nb|");
}

TEST_CASE("run_process applies cwd and environment") {
    fs::path dir = fs::temp_directory_path() / "rb_proc_cwd";
    FS_REMOVE_ALL(dir);
    fs::create_directories(dir);
    auto res = procutil::run_process("sh", {"-c", "pwd; echo $RB_TEST_VAR"}, dir,
                                     {{"RB_TEST_VAR", "hello"}});
    REQUIRE(res.ok());
    REQUIRE(res.out.find(fs::canonical(dir).string()) != std::string::npos);
    REQUIRE(res.out.find("hello") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_process stdin is empty") {
    auto res = procutil::run_process("cat", {});
    REQUIRE(res.ok());
    REQUIRE(res.out.empty());
}

TEST_CASE("run_process drains large output") {
    auto res = procutil::run_process("sh", {"-c", "head -c 200000 /dev/zero | tr '\\0' x; "
                                               "head -c 100000 /dev/zero | tr '\\0' y >&2"});
    REQUIRE(res.ok());
    REQUIRE(res.out.size() == 200000);
    REQUIRE(res.err.size() == 100000);
}

TEST_CASE("run_process reports a missing program") {
    auto res = procutil::run_process("rb-definitely-not-installed", {});
    REQUIRE_FALSE(res.ok());
    REQUIRE(res.exit_code != 0);
}

TEST_CASE("run_process reports signals") {
    auto res = procutil::run_process("sh", {"-c", "kill -TERM $$"});
    REQUIRE(res.exit_code == 128 + 15);
}

TEST_CASE("find_executable searches PATH entries") {
    fs::path dir = fs::temp_directory_path() / "rb_find_exe";
    FS_REMOVE_ALL(dir);
    fs::create_directories(dir / "bin");
    rbt::write_script(dir / "bin" / "fake-tool", "exit 0\n");
    rbt::write_file(dir / "bin" / "not-exec", "data");

    std::string path_env = "/nonexistent:" + (dir / "bin").string();
    auto found = procutil::find_executable("fake-tool", path_env);
    REQUIRE(found);
    REQUIRE(*found == (dir / "bin" / "fake-tool").string());
    REQUIRE_FALSE(procutil::find_executable("not-exec", path_env));
    REQUIRE_FALSE(procutil::find_executable("missing", path_env));

    auto direct = procutil::find_executable((dir / "bin" / "fake-tool").string(), "");
    REQUIRE(direct);
    REQUIRE_FALSE(procutil::find_executable((dir / "bin" / "not-exec").string(), path_env));
    REQUIRE(procutil::find_executable("sh"));
    FS_REMOVE_ALL(dir);
}
