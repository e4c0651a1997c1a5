// =============================================================================
// FILE: src/common/logger.cpp
// =============================================================================
#include "common/logger.h"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace support_router {

// =============================================================================
// LogSink
// =============================================================================

LogSink::LogSink(const LogSinkConfig& config) : config_(config) {
    if (!config_.file_path.empty()) {
        open_file();
    }
}

LogSink::~LogSink() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_ && fp_ != stderr && fp_ != stdout) {
        fflush(fp_);
        fclose(fp_);
        fp_ = nullptr;
    }
}

void LogSink::open_file() {
    fp_ = fopen(config_.file_path.c_str(), "a");
    if (!fp_) {
        fprintf(stderr, "LOGGER: cannot open '%s' (%s), falling back to stderr\n",
                config_.file_path.c_str(), strerror(errno));
        fp_ = stderr;
        return;
    }

    struct stat st;
    current_size_ = (fstat(fileno(fp_), &st) == 0) ? static_cast<size_t>(st.st_size) : 0;
}

std::string LogSink::rotated_path(int index) const {
    return config_.file_path + "." + std::to_string(index);
}

bool LogSink::needs_rotation() const {
    return config_.max_file_size_bytes > 0 &&
           current_size_ >= config_.max_file_size_bytes;
}

void LogSink::rotate() {
    if (!fp_ || fp_ == stderr || fp_ == stdout) return;

    fflush(fp_);
    fclose(fp_);
    fp_ = nullptr;

    // <file>.N is dropped, <file>.i -> <file>.i+1, <file> -> <file>.1
    remove(rotated_path(config_.max_rotated_files).c_str());
    for (int i = config_.max_rotated_files - 1; i >= 1; --i) {
        rename(rotated_path(i).c_str(), rotated_path(i + 1).c_str());
    }
    rename(config_.file_path.c_str(), rotated_path(1).c_str());

    current_size_ = 0;
    open_file();
}

void LogSink::write(LogLevel level, const char* formatted_msg, size_t len) {
    if (level < config_.min_level) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (!fp_) return;

    if (needs_rotation()) {
        rotate();
        if (!fp_) return;
    }

    current_size_ += fwrite(formatted_msg, 1, len, fp_);

    if (config_.also_stderr && fp_ != stderr) {
        fwrite(formatted_msg, 1, len, stderr);
    }
    if (level >= LogLevel::kWarn) {
        fflush(fp_);
    }
}

void LogSink::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_) fflush(fp_);
}


// =============================================================================
// Logger
// =============================================================================

Logger::Logger() : level_(LogLevel::kInfo) {}

Logger::~Logger() {
    flush_all();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LoggingOptions& options) {
    std::lock_guard<std::mutex> lk(configure_mu_);

    sinks_.clear();
    slow_event_sink_.reset();
    access_sink_.reset();

    if (!options.directory.empty()) {
        mkdir(options.directory.c_str(), 0755);
    }
    std::string prefix = options.directory.empty()
        ? options.base_name
        : options.directory + "/" + options.base_name;

    auto make_cfg = [&](const std::string& suffix, LogLevel min_level,
                        int rotated, bool also_stderr) {
        LogSinkConfig cfg;
        cfg.file_path = prefix + suffix;
        cfg.max_file_size_bytes = options.max_file_size_bytes;
        cfg.max_rotated_files = rotated;
        cfg.min_level = min_level;
        cfg.also_stderr = also_stderr;
        return cfg;
    };

    sinks_.push_back(std::make_unique<LogSink>(
        make_cfg(".log", LogLevel::kInfo, options.max_rotated_files,
                 options.console_level <= LogLevel::kInfo)));
    sinks_.push_back(std::make_unique<LogSink>(
        make_cfg("_debug.log", LogLevel::kTrace, options.max_rotated_files / 2, false)));
    sinks_.push_back(std::make_unique<LogSink>(
        make_cfg("_error.log", LogLevel::kError, options.max_rotated_files, true)));

    slow_event_sink_ = std::make_unique<LogSink>(
        make_cfg("_slow.log", LogLevel::kTrace, options.max_rotated_files, false));
    access_sink_ = std::make_unique<LogSink>(
        make_cfg("_access.log", LogLevel::kTrace, options.max_rotated_files, false));

    configured_.store(true, std::memory_order_release);

    fprintf(stderr, "Logger configured: dir=%s base=%s max_size=%zu max_files=%d\n",
            options.directory.c_str(), options.base_name.c_str(),
            options.max_file_size_bytes, options.max_rotated_files);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lk(configure_mu_);
    sinks_.push_back(std::move(sink));
}

size_t Logger::format_message(char* buf, size_t buf_size,
                              LogLevel level, const char* file, int line,
                              const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    auto tid = static_cast<unsigned long>(pthread_self());

    int prefix_len;
    if (file) {
        const char* base = strrchr(file, '/');
        base = base ? base + 1 : file;
        prefix_len = snprintf(buf, buf_size,
            "%04d-%02d-%02d %02d:%02d:%02d.%03d [%s] [tid:%lu] [%s:%d] ",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
            static_cast<int>(ms.count()), log_level_name(level), tid, base, line);
    } else {
        prefix_len = snprintf(buf, buf_size,
            "%04d-%02d-%02d %02d:%02d:%02d.%03d ",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
            static_cast<int>(ms.count()));
    }

    if (prefix_len < 0 || static_cast<size_t>(prefix_len) >= buf_size) {
        return 0;
    }

    int msg_len = vsnprintf(buf + prefix_len,
                            buf_size - static_cast<size_t>(prefix_len),
                            fmt, args);
    if (msg_len < 0) return static_cast<size_t>(prefix_len);

    size_t total = static_cast<size_t>(prefix_len) + static_cast<size_t>(msg_len);
    if (total >= buf_size - 1) total = buf_size - 2;

    buf[total] = '\n';
    buf[total + 1] = '\0';
    return total + 1;
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (level < level_.load(std::memory_order_relaxed)) return;

    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), level, file, line, fmt, args);
    va_end(args);

    if (len == 0) return;

    if (!configured_.load(std::memory_order_acquire)) {
        fwrite(buf, 1, len, stderr);
        if (level >= LogLevel::kWarn) fflush(stderr);
        return;
    }

    for (auto& sink : sinks_) {
        sink->write(level, buf, len);
    }
    if (level == LogLevel::kFatal) {
        flush_all();
    }
}

void Logger::log_slow(const char* file, int line, const char* fmt, ...) {
    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), LogLevel::kWarn, file, line, fmt, args);
    va_end(args);

    if (len == 0) return;

    if (!configured_.load(std::memory_order_acquire)) {
        fwrite(buf, 1, len, stderr);
        return;
    }

    if (slow_event_sink_) {
        slow_event_sink_->write(LogLevel::kWarn, buf, len);
    }
    for (auto& sink : sinks_) {
        sink->write(LogLevel::kWarn, buf, len);
    }
}

void Logger::log_access(const char* fmt, ...) {
    if (!configured_.load(std::memory_order_acquire) || !access_sink_) return;

    char buf[2048];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), LogLevel::kInfo, nullptr, 0, fmt, args);
    va_end(args);

    if (len > 0) access_sink_->write(LogLevel::kInfo, buf, len);
}

void Logger::flush_all() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
    if (slow_event_sink_) slow_event_sink_->flush();
    if (access_sink_) access_sink_->flush();
}

} // namespace support_router
