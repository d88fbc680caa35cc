#include "StdioTransport.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcphub {

namespace {

constexpr int TERMINATE_WAIT_STEPS = 30;   // x 100 ms

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args)
    : command_(std::move(command)), args_(std::move(args)) {
    spdlog::debug("StdioTransport initialized for '{}'", command_);
}

StdioTransport::StdioTransport(const ServiceConfig& config)
    : StdioTransport(config.endpoint, config.args.value_or(std::vector<std::string>{})) {}

StdioTransport::~StdioTransport() {
    disconnect();
}

std::vector<std::string> StdioTransport::split_command(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_quotes = false;
    bool has_word = false;

    for (char c : command) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_word = true;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (has_word) {
                words.push_back(current);
                current.clear();
                has_word = false;
            }
        } else {
            current += c;
            has_word = true;
        }
    }
    if (has_word) {
        words.push_back(current);
    }
    return words;
}

void StdioTransport::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (open_) {
        return;
    }
    if (pid_ >= 0) {
        // Previous child exited on its own; release it before relaunching
        close_fds();
        reap_child();
    }

    std::vector<std::string> argv_words = split_command(command_);
    argv_words.insert(argv_words.end(), args_.begin(), args_.end());
    if (argv_words.empty()) {
        throw ConnectionError(ConnectionError::Reason::Unreachable, "No command specified");
    }

    ignore_sigpipe();

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_error[2] = {-1, -1};

    if (pipe2(to_child, O_CLOEXEC) != 0 || pipe2(from_child, O_CLOEXEC) != 0 ||
        pipe2(exec_error, O_CLOEXEC) != 0 || pipe2(wake_fds_, O_CLOEXEC) != 0) {
        std::string reason = std::strerror(errno);
        for (int* fds : {to_child, from_child, exec_error, wake_fds_}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw ConnectionError(ConnectionError::Reason::Unreachable,
                              "Failed to create pipes: " + reason);
    }

    std::vector<char*> argv;
    for (auto& word : argv_words) {
        argv.push_back(const_cast<char*>(word.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        for (int* fds : {to_child, from_child, exec_error, wake_fds_}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw ConnectionError(ConnectionError::Reason::Unreachable, "Fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(to_child[0], STDIN_FILENO);
        dup2(from_child[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(exec_error[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close_fd(to_child[0]);
    close_fd(from_child[1]);
    close_fd(exec_error[1]);

    // The error pipe closes on a successful exec; otherwise it carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_error[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_error[0]);

    pid_ = pid;
    stdin_fd_ = to_child[1];
    stdout_fd_ = from_child[0];

    if (n > 0) {
        close_fds();
        reap_child();
        throw ConnectionError(ConnectionError::Reason::Unreachable,
                              "Cannot launch '" + argv_words.front() + "': " +
                              std::strerror(child_errno));
    }

    read_buffer_.clear();
    open_ = true;
    spdlog::info("Started process '{}' (pid {})", argv_words.front(), pid_);
}

void StdioTransport::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (pid_ < 0 && stdin_fd_ < 0 && stdout_fd_ < 0) {
        return;
    }

    open_ = false;

    // Wake a reader blocked in poll(), then wait for it to leave
    if (wake_fds_[1] >= 0) {
        char byte = 1;
        ssize_t ignored = write(wake_fds_[1], &byte, 1);
        (void)ignored;
    }

    {
        std::lock_guard<std::mutex> read_lock(read_mutex_);
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        close_fds();
    }

    reap_child();
    spdlog::debug("StdioTransport disconnected");
}

void StdioTransport::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(wake_fds_[0]);
    close_fd(wake_fds_[1]);
}

void StdioTransport::reap_child() {
    if (pid_ <= 0) {
        return;
    }

    int status = 0;
    if (waitpid(pid_, &status, WNOHANG) == 0) {
        kill(pid_, SIGTERM);
        bool exited = false;
        for (int i = 0; i < TERMINATE_WAIT_STEPS; ++i) {
            if (waitpid(pid_, &status, WNOHANG) != 0) {
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!exited) {
            spdlog::warn("Process {} ignored SIGTERM, killing", pid_);
            kill(pid_, SIGKILL);
            waitpid(pid_, &status, 0);
        }
    }
    pid_ = -1;
}

std::optional<Message> StdioTransport::send(const Message& message) {
    std::string serialized = message.to_json().dump();
    write_all(serialized + "\n");
    spdlog::debug("Wrote message: {}", serialized);
    return std::nullopt;
}

void StdioTransport::write_all(const std::string& data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_ || stdin_fd_ < 0) {
        throw ConnectionError(ConnectionError::Reason::NotConnected, "Process not running");
    }

    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ConnectionError(ConnectionError::Reason::Closed,
                                  std::string("Write to process failed: ") + std::strerror(errno));
        }
        total += static_cast<size_t>(n);
    }
}

bool StdioTransport::read_line(std::string& line) {
    while (true) {
        auto newline_pos = read_buffer_.find('\n');
        if (newline_pos != std::string::npos) {
            line = read_buffer_.substr(0, newline_pos);
            read_buffer_.erase(0, newline_pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (!open_ || stdout_fd_ < 0) {
            return false;
        }

        std::array<pollfd, 2> fds{};
        fds[0].fd = stdout_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_fds_[0];
        fds[1].events = POLLIN;

        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on process stdout failed: {}", std::strerror(errno));
            return false;
        }
        if (fds[1].revents != 0 || !open_) {
            return false;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            std::array<char, 4096> buf{};
            ssize_t bytes = read(stdout_fd_, buf.data(), buf.size());
            if (bytes > 0) {
                read_buffer_.append(buf.data(), static_cast<size_t>(bytes));
            } else if (bytes == 0) {
                spdlog::debug("Process closed stdout");
                open_ = false;
                return false;
            } else if (errno != EINTR && errno != EAGAIN) {
                spdlog::error("Read from process failed: {}", std::strerror(errno));
                open_ = false;
                return false;
            }
        }
    }
}

Message StdioTransport::receive() {
    std::lock_guard<std::mutex> lock(read_mutex_);

    std::string line;
    while (read_line(line)) {
        if (line.empty()) {
            continue;
        }
        spdlog::debug("Read message: {}", line);
        return Message::decode(line);
    }

    throw ConnectionError(ConnectionError::Reason::Closed, "Process output closed");
}

bool StdioTransport::is_connected() const {
    return open_;
}

} // namespace mcphub
