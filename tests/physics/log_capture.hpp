/// @file log_capture.hpp
/// @brief Scoped capture of tether log output for tests

#pragma once

#include <tether/core/log.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace tether_test {

/// Attaches a ring buffer sink for the lifetime of the object.
/// Lines are formatted as "<level>|<logger>|<message>".
class LogCapture {
public:
    LogCapture()
        : m_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
        m_sink->set_pattern("%l|%n|%v");
        tether_core::attach_sink(m_sink);
    }

    ~LogCapture() { tether_core::detach_sink(m_sink); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] std::vector<std::string> lines() const { return m_sink->last_formatted(); }

    /// Number of captured lines at @p level whose message contains @p needle
    [[nodiscard]] std::size_t count(const std::string& level, const std::string& needle = "") const {
        auto captured = lines();
        return static_cast<std::size_t>(std::count_if(captured.begin(), captured.end(),
            [&](const std::string& line) {
                return line.rfind(level + "|", 0) == 0 && line.find(needle) != std::string::npos;
            }));
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> m_sink;
};

} // namespace tether_test
