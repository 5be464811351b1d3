#ifndef PICBATCH_FILE_LOG_SINK_HPP
#define PICBATCH_FILE_LOG_SINK_HPP

#include "../../../libpicbatch/include/log_sink.hpp"
#include "../../../libpicbatch/include/logger.hpp"
#include <fstream>
#include <mutex>
#include <string>

class FileLogSink final : public picbatch::ILogSink {
public:
    explicit FileLogSink(const std::string& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const picbatch::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << picbatch::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;

};

#endif // PICBATCH_FILE_LOG_SINK_HPP
