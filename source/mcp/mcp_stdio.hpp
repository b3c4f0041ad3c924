#ifndef MCPGATE_MCP_STDIO_HPP
#define MCPGATE_MCP_STDIO_HPP

// MCP stdio transport: newline-delimited messages over file descriptors.
// The same reader/writer is used on both sides of the relay (client stdio
// and the upstream pipes).

#include <mutex>
#include <string>

namespace mcp_stdio {

// Buffered line reader over a file descriptor.
class LineReader {
public:
    explicit LineReader(int file_descriptor);

    // Read the next line, without its trailing '\n'. A final line with no
    // newline is still returned. Returns false on EOF or read error.
    bool read_line(std::string &line);

private:
    int file_descriptor_;
    std::string buffer_;
    bool end_of_stream_ = false;
};

// Line writer over a file descriptor. write_line() is serialized, so two
// threads writing to the same client never interleave partial lines.
class LineWriter {
public:
    explicit LineWriter(int file_descriptor);

    // Write text followed by '\n'. Returns false if the peer is gone (EPIPE)
    // or the write failed; never throws.
    bool write_line(const std::string &text);

private:
    int file_descriptor_;
    std::mutex mutex_;
};

// Write a log message to stderr (MCP spec allows this for logging).
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // MCPGATE_MCP_STDIO_HPP
