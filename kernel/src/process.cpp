#include "exec_kernel/process.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <cerrno>

namespace exec_kernel {

namespace {

bool apply_rlimit(int resource, int64_t value) {
    if (value < 0) return true;  // unlimited
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    return setrlimit(resource, &rl) == 0;
}

// Close every descriptor above stderr. close_range does it in one call;
// older kernels get a loop bounded by the soft RLIMIT_NOFILE.
void close_inherited_fds() {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0) return;
#endif
    long maxfd = 1024;
    struct rlimit rl;
    if (getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        maxfd = static_cast<long>(std::min<rlim_t>(rl.rlim_cur, 1 << 20));
    }
    for (int fd = 3; fd < maxfd; ++fd) close(fd);
}

std::vector<char*> as_cstrings(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (const auto& s : items) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

} // anonymous namespace

pid_t ProcessManager::spawn(const SpawnSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("spawn: empty argv");
    }

    // Build the exec vectors before fork; the child must not allocate.
    std::vector<char*> argv = as_cstrings(spec.argv);
    std::vector<char*> envp = as_cstrings(spec.env);

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + strerror(errno));
    }

    if (pid == 0) {
        // Own process group so a timeout can take down helpers (pip) too
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (spec.stdout_fd >= 0) dup2(spec.stdout_fd, STDOUT_FILENO);
        if (spec.stderr_fd >= 0) dup2(spec.stderr_fd, STDERR_FILENO);

        close_inherited_fds();

        const auto& lim = spec.limits;
        if (!apply_rlimit(RLIMIT_CPU, lim.max_cpu_seconds) ||
            !apply_rlimit(RLIMIT_AS, lim.max_memory_bytes) ||
            !apply_rlimit(RLIMIT_FSIZE, lim.max_file_size) ||
            !apply_rlimit(RLIMIT_NOFILE, lim.max_open_files) ||
            !apply_rlimit(RLIMIT_NPROC, lim.max_processes)) {
            _exit(126);
        }

        if (!spec.working_dir.empty()) {
            if (chdir(spec.working_dir.c_str()) != 0) {
                _exit(126);
            }
        }

        execve(argv[0], argv.data(), envp.data());
        _exit(127); // exec failed
    }

    setpgid(pid, pid); // mirror the child's setpgid
    return pid;
}

bool ProcessManager::send_signal(pid_t pid, int sig) {
    return kill(pid, sig) == 0;
}

void ProcessManager::kill_group(pid_t pid) {
    if (killpg(pid, SIGKILL) != 0) {
        send_signal(pid, SIGKILL);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace exec_kernel
