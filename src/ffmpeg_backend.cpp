#include "ffmpeg_backend.hpp"
#include "errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace rplayer {

FfmpegProcessBackend::FfmpegProcessBackend(std::string ffmpeg, std::string alsa_device, bool verbose,
                                           bool quiet_output)
    : ffmpeg_(std::move(ffmpeg)), alsa_device_(std::move(alsa_device)), verbose_(verbose),
      quiet_output_(quiet_output) {}

FfmpegProcessBackend::~FfmpegProcessBackend() {
    stop();
}

std::vector<std::string> FfmpegProcessBackend::command_line(const StreamRef& stream) const {
    std::vector<std::string> args = {ffmpeg_, "-nostdin", "-loglevel", verbose_ ? "info" : "warning"};
    if (stream.needs_headers()) {
        std::string headers;
        for (const auto& [key, value] : stream.headers) {
            headers += key + ": " + value + "\r\n";
        }
        args.push_back("-headers");
        args.push_back(headers);
    }
    args.insert(args.end(), {"-i", stream.url, "-f", "alsa", "-ac", "2", "-ar", "48000", alsa_device_});
    return args;
}

void FfmpegProcessBackend::start(const StreamRef& stream) {
    stop();

    std::vector<std::string> args = command_line(stream);
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // exec failures are reported back through a close-on-exec pipe
    int report[2];
    if (pipe2(report, O_CLOEXEC) != 0) {
        throw PlaybackBackendError(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(report[0]);
        close(report[1]);
        throw PlaybackBackendError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        close(report[0]);
        if (quiet_output_) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(report[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(report[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(report[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(report[0]);

    if (n > 0) {
        waitpid(pid, nullptr, 0);
        throw PlaybackBackendError("cannot run " + ffmpeg_ + ": " + std::strerror(child_errno));
    }

    pid_ = pid;
    spdlog::info("ffmpeg: started pid {} for {}", pid_, stream.url);
}

void FfmpegProcessBackend::stop() {
    if (pid_ <= 0) {
        return;
    }

    kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(STOP_TIMEOUT_MS);
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t done = waitpid(pid_, nullptr, WNOHANG);
        if (done == pid_ || (done < 0 && errno == ECHILD)) {
            spdlog::debug("ffmpeg: pid {} stopped", pid_);
            pid_ = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    spdlog::warn("ffmpeg: pid {} ignored SIGTERM, killing", pid_);
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

BackendStatus FfmpegProcessBackend::status() {
    if (pid_ <= 0) {
        return BackendStatus::Stopped;
    }
    int wstatus = 0;
    pid_t done = waitpid(pid_, &wstatus, WNOHANG);
    if (done == 0) {
        return BackendStatus::Running;
    }
    if (done == pid_) {
        if (WIFEXITED(wstatus)) {
            spdlog::warn("ffmpeg: pid {} exited with status {}", pid_, WEXITSTATUS(wstatus));
        } else if (WIFSIGNALED(wstatus)) {
            spdlog::warn("ffmpeg: pid {} killed by signal {}", pid_, WTERMSIG(wstatus));
        }
    }
    pid_ = -1;
    return BackendStatus::Stopped;
}

} // namespace rplayer
