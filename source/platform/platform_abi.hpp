#ifndef MCPGATE_PLATFORM_ABI_HPP
#define MCPGATE_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;  // write end of the child's stdin pipe
    int stdout_fd = -1; // read end of the child's stdout pipe
    std::string error_message;
};

// Spawn a child process with its stdin and stdout connected to pipes; stderr
// is inherited. The executable is looked up on PATH when it has no '/'.
// The child's environment is the current environment.
SpawnResult spawn_process_with_pipes(const std::string &executable,
                                     const std::vector<std::string> &arguments);

// Block until the process exits. Returns its exit status, 128 + signal
// number if it was killed by a signal, or -1 if it cannot be waited for.
int wait_for_exit(int process_id);

// Close a descriptor, ignoring -1. Sets it to -1.
void close_descriptor(int &file_descriptor);

} // namespace platform

#endif // MCPGATE_PLATFORM_ABI_HPP
