#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#include <future>
#include <nlohmann/json.hpp>
#include "test_common.hpp"

#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int, const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
}
extern "C" void closelog() {}
#endif

namespace {

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
        set_log_level(LogLevel::INFO);
    }
};

std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("Logger rotates and limits files") {
    TempDir dir("logger_rotate");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(dir.path() / "migrate.log.1"));
    REQUIRE(fs::exists(dir.path() / "migrate.log.2"));
    REQUIRE_FALSE(fs::exists(dir.path() / "migrate.log.3"));
}

TEST_CASE("Logger compresses rotated files") {
    TempDir dir("logger_compress");
    fs::path log = dir.path() / "migrate.log";
    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    fs::path gz = dir.path() / "migrate.log.1.gz";
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(gz));
    REQUIRE(fs::exists(dir.path() / "migrate.log.2.gz"));
    REQUIRE_FALSE(fs::exists(dir.path() / "migrate.log.1"));

    gzFile zf = gzopen(gz.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);
}

TEST_CASE("Logger writes structured fields as JSON or text") {
    TempDir dir("logger_format");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("Migration succeeded", {{"task", "web"}, {"attempt", "1"}});
    flush_logger();
    set_json_logging(false);
    log_warning("Retry failed", {{"task", "api"}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    nlohmann::json j = nlohmann::json::parse(lines[0]);
    REQUIRE(j["level"] == "INFO");
    REQUIRE(j["msg"] == "Migration succeeded");
    REQUIRE(j["task"] == "web");
    REQUIRE(j["attempt"] == "1");
    REQUIRE(j.contains("timestamp"));
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[WARNING] Retry failed task=api") != std::string::npos);
}

TEST_CASE("Logger drops entries below the minimum level") {
    TempDir dir("logger_level");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string(), LogLevel::WARNING);
    LoggerGuard guard;
    log_debug("hidden");
    log_info("hidden");
    log_error("shown");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[ERROR] shown") != std::string::npos);
}

TEST_CASE("shutdown_logger drains queued messages") {
    TempDir dir("logger_drain");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string());
    LoggerGuard guard;
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
    REQUIRE_FALSE(logger_initialized());
}

TEST_CASE("init_logger preserves queued messages during reinit") {
    TempDir dir("logger_reinit");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string());
    LoggerGuard guard;
    std::atomic<bool> run{true};
    std::atomic<int> produced{0};
    std::thread t([&] {
        while (run.load()) {
            log_info("entry " + std::to_string(produced.fetch_add(1)));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    init_logger(log.string());
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    run.store(false);
    t.join();
    shutdown_logger();
    REQUIRE(read_lines(log).size() >= static_cast<size_t>(produced.load()));
}

TEST_CASE("init_logger keeps the previous file on failed reopen") {
    TempDir dir("logger_fail_reinit");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string());
    LoggerGuard guard;
    log_info("before");
    init_logger((dir.path() / "missing" / "migrate.log").string());
    log_info("after");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].find("after") != std::string::npos);
}

TEST_CASE("init_logger and shutdown_logger can run concurrently") {
    TempDir dir("logger_race");
    init_logger((dir.path() / "one.log").string());
    LoggerGuard guard;
    std::promise<void> go;
    auto ready = go.get_future().share();
    std::thread t1([&] {
        ready.wait();
        init_logger((dir.path() / "two.log").string());
    });
    std::thread t2([&] {
        ready.wait();
        shutdown_logger();
    });
    go.set_value();
    t1.join();
    t2.join();
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
}

TEST_CASE("parse_log_level accepts names case-insensitively") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("verbose", level));
    REQUIRE(level == LogLevel::ERR);
}

TEST_CASE("default_log_sink forwards fields to the global logger") {
    TempDir dir("logger_sink");
    fs::path log = dir.path() / "migrate.log";
    init_logger(log.string());
    LoggerGuard guard;
    default_log_sink().error("Migration failed", {{"task", "web"}, {"failure", "transfer"}});
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[ERROR] Migration failed") != std::string::npos);
    REQUIRE(lines[0].find("failure=transfer") != std::string::npos);
    REQUIRE(lines[0].find("task=web") != std::string::npos);
}

#ifdef __linux__
TEST_CASE("Syslog receives entries with and without a log file") {
    LoggerGuard guard;
    g_syslog_messages.clear();
    init_syslog();
    log_info("inline entry");
    REQUIRE(g_syslog_messages.size() == 1);
    REQUIRE(g_syslog_messages[0].find("inline entry") != std::string::npos);

    TempDir dir("logger_syslog");
    init_logger((dir.path() / "migrate.log").string());
    init_syslog();
    log_info("queued entry");
    flush_logger();
    shutdown_logger();
    REQUIRE(g_syslog_messages.size() == 2);
    REQUIRE(g_syslog_messages[1].find("queued entry") != std::string::npos);
}
#endif
