#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace mcphub {

/**
 * @brief Transport talking to a child process over its stdin/stdout
 *
 * Spawns the service process, writes JSON messages line-by-line to its
 * stdin and reads newline-delimited JSON from its stdout. The child's
 * stderr is inherited so its diagnostics stay visible.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param command Launch command; split on whitespace, double quotes group words
     * @param args Extra arguments appended after the command words
     */
    StdioTransport(std::string command, std::vector<std::string> args = {});

    /**
     * @brief Construct from a service configuration (endpoint + args)
     */
    explicit StdioTransport(const ServiceConfig& config);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void connect() override;
    void disconnect() override;
    std::optional<Message> send(const Message& message) override;
    Message receive() override;
    bool is_connected() const override;
    bool is_full_duplex() const override { return true; }

    /**
     * @brief Process id of the running child, -1 when not running
     */
    pid_t pid() const { return pid_; }

    /**
     * @brief Split a command line into argv words
     */
    static std::vector<std::string> split_command(const std::string& command);

private:
    /**
     * @brief Block until a full line is buffered
     * @return false when the pipe closed or disconnect() was called
     */
    bool read_line(std::string& line);

    void write_all(const std::string& data);
    void close_fds();
    void reap_child();

    std::string command_;
    std::vector<std::string> args_;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int wake_fds_[2] = {-1, -1};   // self-pipe that interrupts a blocked read

    std::atomic<bool> open_{false};
    std::mutex lifecycle_mutex_;
    std::mutex write_mutex_;
    std::mutex read_mutex_;
    std::string read_buffer_;
};

} // namespace mcphub
