#include "mcp/mcp_stdio.hpp"

#include <cerrno>
#include <iostream>
#include <unistd.h>

// MCP stdio transport: line framing over raw file descriptors.
// A broken pipe surfaces as a false return from write_line().

namespace mcp_stdio {

static const size_t READ_CHUNK_SIZE = 64 * 1024;

LineReader::LineReader(int file_descriptor) : file_descriptor_(file_descriptor) {}

bool LineReader::read_line(std::string &line) {
    while (true) {
        size_t newline_position = buffer_.find('\n');
        if (newline_position != std::string::npos) {
            line = buffer_.substr(0, newline_position);
            buffer_.erase(0, newline_position + 1);
            return true;
        }

        if (end_of_stream_) {
            if (buffer_.empty()) {
                return false;
            }
            // Last line without a terminating newline.
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }

        char chunk[READ_CHUNK_SIZE];
        ssize_t bytes_read = ::read(file_descriptor_, chunk, sizeof(chunk));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            end_of_stream_ = true; // Treat read errors like EOF.
            continue;
        }
        if (bytes_read == 0) {
            end_of_stream_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(bytes_read));
    }
}

LineWriter::LineWriter(int file_descriptor) : file_descriptor_(file_descriptor) {}

bool LineWriter::write_line(const std::string &text) {
    std::string framed = text + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    const char *pointer = framed.data();
    size_t remaining = framed.size();
    while (remaining > 0) {
        ssize_t bytes_written = ::write(file_descriptor_, pointer, remaining);
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false; // EPIPE: the reader went away.
        }
        pointer += bytes_written;
        remaining -= static_cast<size_t>(bytes_written);
    }
    return true;
}

void log_message(const std::string &message) {
    std::cerr << "[mcpgate] " << message << std::endl;
}

} // namespace mcp_stdio
