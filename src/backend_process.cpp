#include "backend_process.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

ProcessBackend::ProcessBackend(const std::string& command, int stop_timeout_ms)
    : stop_timeout_ms_(stop_timeout_ms) {
    std::istringstream iss(command);
    std::string arg;
    while (iss >> arg) argv_.push_back(arg);
    if (argv_.empty()) {
        throw std::invalid_argument("Player command is empty");
    }
}

ProcessBackend::~ProcessBackend() {
    stop();
}

void ProcessBackend::play(const std::string& path) {
    stop();

    if (::access(path.c_str(), R_OK) != 0) {
        throw ContentUnreadable("Error opening " + path + ": " + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.reserve(argv_.size() + 2);
    for (auto& a : argv_) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(const_cast<char*>(path.c_str()));
    argv.push_back(nullptr);

    // Keep the player off the controlling terminal's stdin
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, argv_[0].c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        throw ContentUnreadable("Failed to start " + argv_[0] + " for " + path + ": " +
                                std::strerror(rc));
    }

    pid_ = static_cast<int>(pid);
    paused_ = false;
    current_ = path;
    RFID_LOG_DEBUG("Player pid " << pid_ << " started for " << path);
}

void ProcessBackend::pause() {
    if (pid_ <= 0 || paused_) return;
    if (::kill(pid_, SIGSTOP) == 0) {
        paused_ = true;
    } else {
        RFID_LOG_WARN("Failed to pause player: " << std::strerror(errno));
    }
}

void ProcessBackend::resume() {
    if (pid_ <= 0 || !paused_) return;
    if (::kill(pid_, SIGCONT) == 0) {
        paused_ = false;
    } else {
        RFID_LOG_WARN("Failed to resume player: " << std::strerror(errno));
    }
}

void ProcessBackend::stop() {
    if (pid_ <= 0) return;

    // A stopped process only acts on SIGTERM once continued
    if (paused_) ::kill(pid_, SIGCONT);
    ::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(stop_timeout_ms_);
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    RFID_LOG_WARN("Player pid " << pid_ << " ignored SIGTERM, killing");
    ::kill(pid_, SIGKILL);
    int status = 0;
    ::waitpid(pid_, &status, 0);
    pid_ = -1;
    paused_ = false;
}

bool ProcessBackend::is_finished() {
    if (pid_ <= 0) return true;
    return reap(true);
}

bool ProcessBackend::reap(bool log_status) {
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return false;

    if (r == pid_ && log_status) {
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
            RFID_LOG_WARN("Player exited with code " << WEXITSTATUS(status) << " on " << current_);
        } else if (WIFSIGNALED(status)) {
            RFID_LOG_WARN("Player killed by signal " << WTERMSIG(status) << " on " << current_);
        }
    }

    // r < 0 (ECHILD): nothing left to wait for
    pid_ = -1;
    paused_ = false;
    return true;
}
