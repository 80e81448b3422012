#include "process_runner.h"
#include <sys/wait.h>
#include <sys/resource.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <mutex>
#include <condition_variable>

namespace cverify {

namespace {

// Syscalls no build tool needs; everything else stays allowed so shells,
// git and the strip tools run unmodified
const int DENIED_SYSCALLS[] = {
    SCMP_SYS(ptrace), SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root),
    SCMP_SYS(chroot), SCMP_SYS(setns), SCMP_SYS(unshare), SCMP_SYS(reboot),
    SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module),
    SCMP_SYS(delete_module), SCMP_SYS(swapon), SCMP_SYS(swapoff),
    SCMP_SYS(bpf), SCMP_SYS(perf_event_open), SCMP_SYS(keyctl),
    SCMP_SYS(add_key), SCMP_SYS(request_key)
};

} // namespace

class ProcessRunner::Impl {
public:
    ProcessLimits limits_;

    explicit Impl(const ProcessLimits& limits) : limits_(limits) {}

    ProcessResult run(const std::vector<std::string>& command,
                      const std::string& working_dir,
                      const std::map<std::string, std::string>& env) {
        ProcessResult result;
        if (command.empty()) {
            result.error_message = "Empty command";
            return result;
        }

        int stdout_pipe[2], stderr_pipe[2];
        if (pipe(stdout_pipe) == -1) {
            result.error_message = std::string("Failed to create pipes: ") + strerror(errno);
            return result;
        }
        if (pipe(stderr_pipe) == -1) {
            result.error_message = std::string("Failed to create pipes: ") + strerror(errno);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            return result;
        }

        pid_t pid = fork();
        if (pid == -1) {
            result.error_message = std::string("Failed to fork process: ") + strerror(errno);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
            return result;
        }

        if (pid == 0) {
            exec_child(command, working_dir, env, stdout_pipe, stderr_pipe);
            _exit(127);
        }

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        // Wall-clock watchdog; kills the whole process group
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        bool killed = false;
        std::thread watchdog([&]() {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv.wait_for(lock, limits_.timeout, [&] { return finished; })) {
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                killed = true;
            }
        });

        read_pipes(stdout_pipe[0], stderr_pipe[0], result);

        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited == -1 && errno == EINTR);

        {
            std::lock_guard<std::mutex> lock(mutex);
            finished = true;
        }
        cv.notify_one();
        watchdog.join();

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        if (waited == -1) {
            result.error_message = "Failed to wait for child process";
            return result;
        }
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = -WTERMSIG(status);
        }
        if (killed) {
            result.timed_out = true;
            result.error_message = "Process killed after " +
                std::to_string(limits_.timeout.count()) + "s";
        }
        return result;
    }

private:
    void exec_child(const std::vector<std::string>& command,
                    const std::string& working_dir,
                    const std::map<std::string, std::string>& env,
                    int stdout_pipe[2], int stderr_pipe[2]) {
        setpgid(0, 0);

        // The daemon blocks SIGINT/SIGTERM; tools get a clean mask
        sigset_t no_signals;
        sigemptyset(&no_signals);
        sigprocmask(SIG_SETMASK, &no_signals, nullptr);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            perror("chdir");
            _exit(126);
        }

        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        apply_resource_limits();

        if (limits_.seccomp && !load_seccomp_filter()) {
            fprintf(stderr, "seccomp: failed to load filter\n");
            _exit(126);
        }

        std::vector<char*> argv;
        for (const auto& arg : command) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        perror("execvp");
        _exit(127);
    }

    void apply_resource_limits() {
        struct rlimit limit;

        limit.rlim_cur = limit.rlim_max = limits_.max_memory_mb * 1024 * 1024;
        setrlimit(RLIMIT_AS, &limit);

        limit.rlim_cur = limit.rlim_max = limits_.max_file_size_mb * 1024 * 1024;
        setrlimit(RLIMIT_FSIZE, &limit);

        limit.rlim_cur = limit.rlim_max = limits_.max_open_files;
        setrlimit(RLIMIT_NOFILE, &limit);

        limit.rlim_cur = limit.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &limit);
    }

    bool load_seccomp_filter() {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) {
            return false;
        }

        for (int syscall : DENIED_SYSCALLS) {
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0) != 0) {
                seccomp_release(ctx);
                return false;
            }
        }

        int rc = seccomp_load(ctx);
        seccomp_release(ctx);
        return rc == 0;
    }

    void read_pipes(int out_fd, int err_fd, ProcessResult& result) {
        struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
        std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
        int open_count = 2;
        char buffer[PIPE_BUFFER_SIZE];

        while (open_count > 0) {
            int ready = poll(fds, 2, -1);
            if (ready == -1) {
                if (errno == EINTR) continue;
                break;
            }
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    sinks[i]->append(buffer, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }
};

ProcessRunner::ProcessRunner(const ProcessLimits& limits)
    : impl_(std::make_unique<Impl>(limits)) {}

ProcessRunner::~ProcessRunner() = default;

ProcessResult ProcessRunner::run(const std::vector<std::string>& command,
                                 const std::string& working_dir,
                                 const std::map<std::string, std::string>& env) {
    return impl_->run(command, working_dir, env);
}

const ProcessLimits& ProcessRunner::limits() const {
    return impl_->limits_;
}

} // namespace cverify
