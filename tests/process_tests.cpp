#include "test_common.hpp"

using procutil::CommandSpec;
using procutil::run_command;

TEST_CASE("run_command captures output and exit status") {
    CommandSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "echo out; echo err 1>&2; exit 3"};
    auto r = run_command(spec);
    REQUIRE(r.exit_code == 3);
    REQUIRE_FALSE(r.timed_out);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.output.find("out") != std::string::npos);
    REQUIRE(r.output.find("err") != std::string::npos);
}

TEST_CASE("run_command applies environment overrides") {
    ScopedEnv inherited("GITMIGRATE_TEST_INHERITED", "parent");
    CommandSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "echo \"$GITMIGRATE_TEST_VAR:$GITMIGRATE_TEST_INHERITED\""};
    spec.env["GITMIGRATE_TEST_VAR"] = "child";
    auto r = run_command(spec);
    REQUIRE(r.ok());
    REQUIRE(r.output == "child:parent\n");
}

TEST_CASE("run_command overrides replace inherited values") {
    ScopedEnv inherited("GITMIGRATE_TEST_VAR", "parent");
    CommandSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "echo $GITMIGRATE_TEST_VAR"};
    spec.env["GITMIGRATE_TEST_VAR"] = "child";
    REQUIRE(run_command(spec).output == "child\n");
}

TEST_CASE("run_command honours the working directory") {
    TempDir dir("proc_cwd");
    CommandSpec spec;
    spec.program = "pwd";
    spec.working_dir = dir.path();
    auto r = run_command(spec);
    REQUIRE(r.ok());
    REQUIRE(fs::equivalent(fs::path(r.output.substr(0, r.output.find('\n'))), dir.path()));
}

TEST_CASE("run_command reports a missing program as exit 127") {
    CommandSpec spec;
    spec.program = "gitmigrate-no-such-program";
    auto r = run_command(spec);
    REQUIRE(r.exit_code == 127);
}

TEST_CASE("run_command kills the process group on timeout") {
    CommandSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "sleep 30 & sleep 30"};
    spec.timeout = std::chrono::milliseconds(300);
    auto start = std::chrono::steady_clock::now();
    auto r = run_command(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.timed_out);
    REQUIRE_FALSE(r.ok());
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("run_command timeout of one call does not affect others") {
    std::atomic<bool> slow_timed_out{false};
    std::atomic<bool> fast_ok{false};
    {
        th_compat::jthread slow([&] {
            CommandSpec spec;
            spec.program = "sleep";
            spec.args = {"10"};
            spec.timeout = std::chrono::milliseconds(200);
            slow_timed_out = run_command(spec).timed_out;
        });
        th_compat::jthread fast([&] {
            CommandSpec spec;
            spec.program = "sh";
            spec.args = {"-c", "sleep 0.5; echo done"};
            spec.timeout = std::chrono::seconds(10);
            auto r = run_command(spec);
            fast_ok = r.ok() && r.output == "done\n";
        });
    }
    REQUIRE(slow_timed_out.load());
    REQUIRE(fast_ok.load());
}

TEST_CASE("run_command accepts timeouts beyond the poll range") {
    CommandSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "echo done"};
    spec.timeout = std::chrono::seconds(30000000);
    auto r = run_command(spec);
    REQUIRE(r.ok());
    REQUIRE_FALSE(r.timed_out);
    REQUIRE(r.output == "done\n");
}

TEST_CASE("run_command truncates oversized output") {
    CommandSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "head -c 10000 /dev/zero | tr '\\0' a"};
    auto r = run_command(spec, 100);
    REQUIRE(r.ok());
    REQUIRE(r.output.size() == 100);
}

TEST_CASE("run_command gives the child an empty stdin") {
    CommandSpec spec;
    spec.program = "cat";
    spec.timeout = std::chrono::seconds(5);
    auto r = run_command(spec);
    REQUIRE(r.ok());
    REQUIRE(r.output.empty());
}
