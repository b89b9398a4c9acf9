/**
 * @file process_unit.cpp
 * @brief ProcessUnit implementation: fork(), socketpair framing, waitpid.
 * @author Dimitris Kafetzis
 */

#include "executor/process_unit.hpp"

#include "executor/unit_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

#include <dirent.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace adaptive_pool {

namespace {

constexpr int kPollIntervalMs = 100;   // stop-token check cadence
constexpr int kChildProtocolExit = 3;

enum class ReadStatus { Ok, Eof, Stopped };

bool send_all(int fd, const void* buf, size_t len) {
    const auto* p = static_cast<const uint8_t*>(buf);
    while (len > 0) {
        ssize_t n = ::send(fd, p, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

/**
 * @brief Read exactly len bytes, polling so the stop token is honored.
 */
ReadStatus read_exact(int fd, void* buf, size_t len, std::stop_token stop) {
    auto* p = static_cast<uint8_t*>(buf);
    while (len > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Eof;
        }
        if (ready == 0) {
            if (stop.stop_requested()) return ReadStatus::Stopped;
            continue;
        }

        ssize_t n = ::read(fd, p, len);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ReadStatus::Eof;
        }
        if (n == 0) return ReadStatus::Eof;
        p += n;
        len -= static_cast<size_t>(n);
    }
    return ReadStatus::Ok;
}

/// Blocking variant for the child, which has nothing else to do.
bool child_read_exact(int fd, void* buf, size_t len) {
    auto* p = static_cast<uint8_t*>(buf);
    while (len > 0) {
        ssize_t n = ::read(fd, p, len);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

/**
 * @brief Close every descriptor the child inherited except stdio and its channel.
 *
 * Without this a child would keep other units' channels open and their
 * parents would never observe EOF when those units die.
 */
void close_inherited_fds(int keep_fd) {
    if (DIR* dir = ::opendir("/proc/self/fd")) {
        int dir_fd = ::dirfd(dir);
        std::vector<int> to_close;
        while (dirent* entry = ::readdir(dir)) {
            if (entry->d_name[0] < '0' || entry->d_name[0] > '9') continue;
            int fd = std::atoi(entry->d_name);
            if (fd > STDERR_FILENO && fd != keep_fd && fd != dir_fd) {
                to_close.push_back(fd);
            }
        }
        ::closedir(dir);
        for (int fd : to_close) ::close(fd);
        return;
    }

    rlimit limit{};
    int max_fd = 1024;
    if (::getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<int>(std::min<rlim_t>(limit.rlim_cur, 65536));
    }
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        if (fd != keep_fd) ::close(fd);
    }
}

/**
 * @brief Child process body: serve requests until the parent half-closes.
 */
[[noreturn]] void child_main(int fd, const TaskHandler& handler) {
    std::signal(SIGPIPE, SIG_IGN);
    std::stop_source never_stopped;

    while (true) {
        uint8_t header[4];
        if (!child_read_exact(fd, header, sizeof(header))) ::_exit(kCleanExit);

        uint32_t len = UnitCodec::get_u32(header);
        if (len > UnitCodec::MAX_FRAME_SIZE) ::_exit(kChildProtocolExit);

        std::vector<uint8_t> body(len);
        if (len > 0 && !child_read_exact(fd, body.data(), len)) ::_exit(kCleanExit);

        auto request = UnitCodec::decode_request(body);
        if (!request) ::_exit(kChildProtocolExit);

        UnitResponse response;
        response.task = request->first;

        auto start = std::chrono::steady_clock::now();
        try {
            auto outcome = handler(request->second, never_stopped.get_token());
            response.success = outcome.has_value();
            response.data = outcome.has_value() ? std::move(outcome.value())
                                                : outcome.error().message;
        } catch (...) {
            ::_exit(kHandlerCrashExit);
        }
        response.duration = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start);

        auto encoded = UnitCodec::encode_response(response);
        if (encoded.size() > UnitCodec::MAX_FRAME_SIZE) {
            // The parent would read an oversized frame as a corrupt channel.
            response.success = false;
            response.data = "Output of " + std::to_string(response.data.size())
                            + " bytes exceeds maximum frame size";
            encoded = UnitCodec::encode_response(response);
        }

        auto frame = UnitCodec::frame(encoded);
        if (!send_all(fd, frame.data(), frame.size())) ::_exit(kCleanExit);
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

Result<std::unique_ptr<ProcessUnit>> ProcessUnit::spawn(UnitId id,
                                                        TaskHandler handler,
                                                        UnitEventSink sink) {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        return Error{"socketpair failed: " + std::string(strerror(errno)), ErrorKind::Spawn};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Error{"fork failed: " + std::string(strerror(err)), ErrorKind::Spawn};
    }

    if (pid == 0) {
        ::close(fds[0]);
        close_inherited_fds(fds[1]);
        child_main(fds[1], handler);
    }

    ::close(fds[1]);
    try {
        return std::make_unique<ProcessUnit>(ConstructionKey{}, id, pid, fds[0], std::move(sink));
    } catch (const std::system_error& err) {
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(fds[0]);
        return Error{"Failed to start reader thread: " + std::string{err.what()},
                     ErrorKind::Spawn};
    }
}

ProcessUnit::ProcessUnit(ConstructionKey, UnitId id, pid_t pid, int channel_fd,
                         UnitEventSink sink)
    : id_(id)
    , pid_(pid)
    , channel_fd_(channel_fd)
    , sink_(std::move(sink))
    , reader_([this](std::stop_token stop) { reader_loop(stop); }) {}

ProcessUnit::~ProcessUnit() {
    silenced_.store(true);
    if (!reaped_.load()) {
        ::kill(pid_, SIGKILL);
    }
    reader_.request_stop();
    if (reader_.joinable()) reader_.join();
    ::close(channel_fd_);
}

// ─────────────────────────────────────────────
// IExecutionUnit
// ─────────────────────────────────────────────

Result<void> ProcessUnit::assign(TaskId task, const Payload& payload) {
    std::lock_guard lock(mutex_);
    if (reaped_.load() || killed_.load()) {
        return Error{"Unit " + std::to_string(id_) + " is not alive", ErrorKind::WorkerCrash};
    }
    if (stopping_) {
        return Error{"Unit " + std::to_string(id_) + " is stopping", ErrorKind::Shutdown};
    }
    if (current_task_) {
        return Error{"Unit " + std::to_string(id_) + " already holds a task",
                     ErrorKind::UnitBusy};
    }

    auto frame = UnitCodec::frame(UnitCodec::encode_request(task, payload));
    if (frame.size() - 4 > UnitCodec::MAX_FRAME_SIZE) {
        return Error{"Payload exceeds maximum frame size", ErrorKind::Protocol};
    }

    current_task_ = task;
    if (!send_all(channel_fd_, frame.data(), frame.size())) {
        current_task_.reset();
        return Error{"Send to unit " + std::to_string(id_) + " failed: "
                     + std::string(strerror(errno)), ErrorKind::WorkerCrash};
    }
    return Result<void>{};
}

void ProcessUnit::request_stop() {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    stopping_ = true;
    ::shutdown(channel_fd_, SHUT_WR);
}

void ProcessUnit::kill() {
    if (killed_.exchange(true)) return;
    if (!reaped_.load()) {
        ::kill(pid_, SIGKILL);
    }
}

bool ProcessUnit::alive() const noexcept {
    return !reaped_.load();
}

// ─────────────────────────────────────────────
// Reader Thread
// ─────────────────────────────────────────────

void ProcessUnit::reader_loop(std::stop_token stop) {
    while (true) {
        uint8_t header[4];
        if (read_exact(channel_fd_, header, sizeof(header), stop) != ReadStatus::Ok) break;

        uint32_t len = UnitCodec::get_u32(header);
        if (len > UnitCodec::MAX_FRAME_SIZE) {
            ::kill(pid_, SIGKILL);  // corrupted channel: treat as a crash
            break;
        }

        std::vector<uint8_t> body(len);
        if (len > 0 && read_exact(channel_fd_, body.data(), len, stop) != ReadStatus::Ok) break;

        handle_frame(body);
    }

    int exit_code = reap();
    emit(UnitExit{.unit = id_, .exit_code = exit_code});
}

void ProcessUnit::handle_frame(const std::vector<uint8_t>& body) {
    auto response = UnitCodec::decode_response(body);
    if (!response) {
        ::kill(pid_, SIGKILL);
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (!current_task_ || *current_task_ != response->task) {
            ::kill(pid_, SIGKILL);
            return;
        }
        current_task_.reset();
    }

    if (killed_.load()) return;

    if (response->success) {
        emit(UnitResult{.unit = id_, .task = response->task,
                        .output = std::move(response->data), .duration = response->duration});
    } else {
        emit(UnitFailure{.unit = id_, .task = response->task,
                         .message = std::move(response->data), .duration = response->duration});
    }
}

int ProcessUnit::reap() {
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    reaped_.store(true);
    if (r < 0) return -1;
    if (killed_.load() && WIFSIGNALED(status)) return kKilledExit;
    return decode_wait_status(status);
}

void ProcessUnit::emit(UnitEvent event) {
    if (silenced_.load()) return;
    sink_(std::move(event));
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

UnitFactory make_process_unit_factory(TaskHandler handler) {
    return [handler = std::move(handler)](UnitId id, UnitEventSink sink)
               -> Result<std::unique_ptr<IExecutionUnit>> {
        auto unit = ProcessUnit::spawn(id, handler, std::move(sink));
        if (!unit) return unit.error();
        std::unique_ptr<IExecutionUnit> base = std::move(unit).value();
        return Result<std::unique_ptr<IExecutionUnit>>{std::move(base)};
    };
}

}  // namespace adaptive_pool
