#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};

static std::vector<std::string> g_secrets;
static std::mutex g_secrets_mtx;

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<std::unique_ptr<LogMessage>> g_log_queue;
static size_t g_in_flight = 0;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static std::atomic<bool> g_running{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    } else {
        g_log_ofs.clear();
    }
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string val = text;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        out = LogLevel::DEBUG;
    else if (val == "INFO")
        out = LogLevel::INFO;
    else if (val == "WARNING" || val == "WARN")
        out = LogLevel::WARNING;
    else if (val == "ERROR" || val == "ERR")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

const char* log_level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_rotation(size_t max_files) { g_max_files.store(max_files); }

void add_log_secret(const std::string& secret) {
    if (secret.empty())
        return;
    std::lock_guard<std::mutex> lk(g_secrets_mtx);
    if (std::find(g_secrets.begin(), g_secrets.end(), secret) == g_secrets.end())
        g_secrets.push_back(secret);
}

void clear_log_secrets() {
    std::lock_guard<std::mutex> lk(g_secrets_mtx);
    g_secrets.clear();
}

std::string redact_secrets(const std::string& text) {
    std::string out = text;
    {
        std::lock_guard<std::mutex> lk(g_secrets_mtx);
        for (const auto& s : g_secrets) {
            size_t pos = 0;
            while ((pos = out.find(s, pos)) != std::string::npos) {
                out.replace(pos, s.size(), "***");
                pos += 3;
            }
        }
    }
    // scheme://userinfo@host -> scheme://***@host
    size_t pos = 0;
    while ((pos = out.find("://", pos)) != std::string::npos) {
        size_t start = pos + 3;
        size_t end = out.find_first_of("/ \t\r\n\"'", start);
        size_t at = out.rfind('@', end == std::string::npos ? out.size() - 1 : end - 1);
        if (at != std::string::npos && at >= start && out.compare(start, at - start, "***") != 0)
            out.replace(start, at - start, "***");
        pos = start;
    }
    return out;
}

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return g_in_flight == 0 || !g_running.load(); });
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            gzwrite(out, buf, static_cast<unsigned int>(n));
    }
    return gzclose(out) == Z_OK;
}

/**
 * @brief Shift `<log>.N[.gz]` to `<log>.N+1[.gz]` and move the active file to
 * `<log>.1`, compressing it when enabled.
 */
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    const std::string suffix = gz ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep)
            fs::remove(src, ec);
        else
            fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (gz && gzip_file(first.string(), first.string() + ".gz"))
        fs::remove(first, ec);
}

static void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open() || m.level < g_min_level.load())
        return;
    std::string line;
    const char* label = log_level_label(m.level);
    if (g_json_log.load()) {
        nlohmann::json j{{"timestamp", timestamp()}, {"level", label}, {"msg", m.msg}};
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        line = j.dump();
    } else {
        line = "[" + timestamp() + "] [" + label + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    g_log_ofs << line << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    if (fs::file_size(g_log_path, ec) > g_max_size.load() && !ec) {
        g_log_ofs.close();
        if (g_max_files.load() > 0)
            rotate_files();
        g_log_ofs.open(g_log_path, std::ios::trunc);
    }
}

static void enqueue_message(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load() || !g_running.load())
        return;
    auto entry = std::make_unique<LogMessage>();
    entry->level = level;
    entry->msg = redact_secrets(msg);
    for (const auto& [k, v] : fields)
        entry->fields[k] = redact_secrets(v);
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push(std::move(entry));
        ++g_in_flight;
    }
    g_queue_cv.notify_one();
}

void log_event(LogLevel level, const std::string& message) { enqueue_message(level, message, {}); }

void log_event(LogLevel level, const std::string& message, const std::string& data) {
    if (data.empty())
        enqueue_message(level, message, {});
    else
        enqueue_message(level, message, {{"data", data}});
}

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    enqueue_message(level, message, fields);
}

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const std::string& data) {
    log_event(LogLevel::DEBUG, msg, data);
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const std::string& data) {
    log_event(LogLevel::INFO, msg, data);
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const std::string& data) {
    log_event(LogLevel::WARNING, msg, data);
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const std::string& data) {
    log_event(LogLevel::ERR, msg, data);
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<std::unique_ptr<LogMessage>> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(*m);
        g_log_ofs.flush();
        lk.lock();
        g_in_flight -= batch.size();
        batch.clear();
        if (g_in_flight == 0)
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    while (!g_log_queue.empty())
        g_log_queue.pop();
    g_in_flight = 0;
}
