#include "exec_kernel/sandbox.h"

#include "exec_kernel/file_utils.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>

namespace exec_kernel {

namespace {

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("pipe failed: ") + strerror(errno));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const noexcept { return fds_[0]; }
    int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept {
        if (fds_[0] >= 0) { close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() noexcept {
        if (fds_[1] >= 0) { close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

// Read whatever is available from fd. Returns false at EOF or on error.
bool drain(int fd, std::string& out, size_t cap) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    if (n <= 0) return false;
    if (out.size() < cap) {
        out.append(buf, std::min(static_cast<size_t>(n), cap - out.size()));
    }
    return true;
}

void record_status(int status, ExecutionOutcome& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.term_signal = WTERMSIG(status);
        result.crashed = true;
    }
}

int plot_index(const std::string& name) {
    // plot_<digits>.png
    const std::string prefix = "plot_";
    const std::string suffix = ".png";
    if (name.size() <= prefix.size() + suffix.size()) return -1;
    std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (digits.empty() || digits.size() > 6 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return -1;
    }
    return std::atoi(digits.c_str());
}

} // anonymous namespace

ExecutionOutcome Sandbox::run(const std::vector<std::string>& argv, const SandboxPolicy& policy) {
    return run_with_timeout(argv, 0, policy);
}

ExecutionOutcome Sandbox::run_with_timeout(
    const std::vector<std::string>& argv,
    double timeout_seconds,
    const SandboxPolicy& policy
) {
    Pipe out_pipe;
    Pipe err_pipe;

    auto start = std::chrono::steady_clock::now();

    SpawnSpec spec;
    spec.argv = argv;
    spec.env = policy.env;
    spec.working_dir = policy.working_dir;
    spec.limits = policy.limits;
    spec.stdout_fd = out_pipe.write_end();
    spec.stderr_fd = err_pipe.write_end();

    pid_t pid = ProcessManager::spawn(spec);
    spdlog::debug("Spawned pid {} ({})", pid, argv.front());

    // Parent: keep only the read ends
    out_pipe.close_write();
    err_pipe.close_write();

    ExecutionOutcome result;

    const bool bounded = timeout_seconds > 0;
    const auto deadline = start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(timeout_seconds));

    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    int status = 0;

    // Read both streams while waiting so a chatty child never blocks on a full pipe.
    while (!exited) {
        int wait_ms = 100;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                ProcessManager::kill_group(pid);
                result.timed_out = true;
                result.exit_code = -1;
                spdlog::warn("pid {} exceeded {:.1f}s deadline, killed", pid, timeout_seconds);
                break;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining, 100));
        }

        struct pollfd pfds[2];
        int nfds = 0;
        if (out_open) pfds[nfds++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_open) pfds[nfds++] = {err_pipe.read_end(), POLLIN, 0};

        if (nfds > 0) {
            int ret = poll(pfds, static_cast<nfds_t>(nfds), wait_ms);
            if (ret < 0 && errno != EINTR) {
                int err = errno;
                ProcessManager::kill_group(pid);
                throw std::runtime_error(std::string("poll failed: ") + strerror(err));
            }
            for (int i = 0; ret > 0 && i < nfds; ++i) {
                if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (pfds[i].fd == out_pipe.read_end()) {
                    out_open = drain(pfds[i].fd, result.stdout_output, policy.max_capture_bytes);
                } else {
                    err_open = drain(pfds[i].fd, result.stderr_output, policy.max_capture_bytes);
                }
            }
        }

        pid_t w = waitpid(pid, &status, (nfds == 0 && !bounded) ? 0 : WNOHANG);
        if (w == pid) {
            exited = true;
        } else if (w < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + strerror(errno));
        } else if (nfds == 0) {
            // Both streams closed but the child lingers
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    if (exited) {
        record_status(status, result);
        // Stragglers in the group (background helpers) must not outlive the run
        killpg(pid, SIGKILL);
        for (int fd : {out_pipe.read_end(), err_pipe.read_end()}) {
            std::string& sink = fd == out_pipe.read_end() ? result.stdout_output : result.stderr_output;
            struct pollfd pfd{fd, POLLIN, 0};
            while (poll(&pfd, 1, 0) > 0 && drain(fd, sink, policy.max_capture_bytes)) {
            }
        }
        if (result.crashed) {
            spdlog::warn("pid {} terminated by signal {}", pid, result.term_signal);
        }
    }

    auto end = std::chrono::steady_clock::now();
    result.elapsed_seconds = std::chrono::duration<double>(end - start).count();

    return result;
}

ExecutionOutcome Sandbox::run_program(
    const ProgramBuilder& build,
    double timeout_seconds,
    const RunnerOptions& options
) {
    TempDir scratch("exec_kernel-");

    const std::string module = kModuleName;
    FileUtils::write_file(scratch.file(module + ".py"), build(scratch.path()));
    FileUtils::write_file(scratch.file("__init__.py"), "");

    SandboxPolicy policy;
    policy.limits = options.limits;
    policy.working_dir = options.working_dir;
    policy.max_capture_bytes = options.max_capture_bytes;
    policy.env = {
        "PYTHONPATH=" + scratch.path(),
        "PYTHONUNBUFFERED=1",
    };

    ExecutionOutcome outcome = run_with_timeout(
        {options.interpreter, "-m", module}, timeout_seconds, policy);

    if (!outcome.timed_out && !options.plot_output_dir.empty()) {
        outcome.plot_files = publish_plots(scratch.path(), options.plot_output_dir);
    }
    return outcome;
}

std::vector<std::string> Sandbox::publish_plots(
    const std::string& scratch_dir,
    const std::string& output_dir
) {
    std::vector<std::pair<int, std::string>> found;
    for (const auto& entry : FileUtils::search(scratch_dir, "plot_*.png", 0)) {
        if (entry.is_dir) continue;
        std::string name = entry.path.substr(entry.path.rfind('/') + 1);
        int index = plot_index(name);
        if (index >= 0) found.emplace_back(index, std::move(name));
    }
    std::sort(found.begin(), found.end());

    std::vector<std::string> published;
    for (const auto& [index, name] : found) {
        std::string dest = output_dir == "." ? name : output_dir + "/" + name;
        try {
            FileUtils::copy_file(scratch_dir + "/" + name, dest);
            published.push_back(dest);
        } catch (const std::exception& e) {
            spdlog::warn("Could not publish plot {}: {}", name, e.what());
        }
    }
    if (!published.empty()) {
        spdlog::info("Published {} plot(s) to {}", published.size(), output_dir);
    }
    return published;
}

} // namespace exec_kernel
