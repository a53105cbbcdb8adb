#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>

namespace exec_kernel {

struct ResourceLimits {
    int64_t max_cpu_seconds = -1;   // RLIMIT_CPU, -1 = unlimited
    int64_t max_memory_bytes = -1;  // RLIMIT_AS
    int64_t max_file_size = -1;     // RLIMIT_FSIZE
    int64_t max_open_files = 256;   // RLIMIT_NOFILE
    int64_t max_processes = -1;     // RLIMIT_NPROC
};

/// Everything needed to start one child. The environment is passed verbatim;
/// nothing is inherited from the parent.
struct SpawnSpec {
    std::vector<std::string> argv;
    std::vector<std::string> env;   // KEY=VALUE pairs
    std::string working_dir;        // empty = inherit
    ResourceLimits limits;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

class ProcessManager {
public:
    /// Fork and exec argv[0] in a new process group. Returns child PID.
    static pid_t spawn(const SpawnSpec& spec);

    /// Send a signal to a process.
    static bool send_signal(pid_t pid, int signal);

    /// SIGKILL the process group led by pid and reap the leader.
    static void kill_group(pid_t pid);
};

} // namespace exec_kernel
