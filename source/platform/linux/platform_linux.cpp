#include "platform/platform_abi.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace platform {

static void close_pipe(int pipe_descriptors[2]) {
    close_descriptor(pipe_descriptors[0]);
    close_descriptor(pipe_descriptors[1]);
}

SpawnResult spawn_process_with_pipes(const std::string &executable,
                                     const std::vector<std::string> &arguments) {
    SpawnResult result;

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }

    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    // O_CLOEXEC keeps our ends out of the child; dup2 clears the flag on the
    // descriptors that become the child's stdin/stdout.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe2 failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe2 failed: " + std::string(strerror(errno));
        close_pipe(stdin_pipe);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);

    // The relay ignores SIGPIPE; the child gets the default disposition back.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGDEF);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable.c_str(),
                                    &file_actions, &attributes,
                                    argv_pointers.data(), environ);

    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    // The child's ends are no longer needed in this process.
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);

    if (spawn_status != 0) {
        result.error_message = "posix_spawnp failed for '" + executable + "': " +
                               std::string(strerror(spawn_status));
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = stdin_pipe[1];
    result.stdout_fd = stdout_pipe[0];
    return result;
}

int wait_for_exit(int process_id) {
    if (process_id <= 0) {
        return -1;
    }

    int status = 0;
    while (waitpid(static_cast<pid_t>(process_id), &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void close_descriptor(int &file_descriptor) {
    if (file_descriptor >= 0) {
        ::close(file_descriptor);
        file_descriptor = -1;
    }
}

} // namespace platform
