/**
 * StdioServer Implementation
 */

#include "stdio_server.hpp"
#include "logger.h"

#include <sys/select.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#define RX_CHUNK_SIZE     4096
#define RX_BUFFER_LIMIT   (1024 * 1024)

static const char *TAG = "Stdio";

StdioServer::StdioServer(JsonRpc &rpc, int in_fd, int out_fd)
    : m_rpc(rpc), m_in_fd(in_fd), m_out_fd(out_fd) {
}

bool StdioServer::tick(int timeout_ms) {
    if (!m_open) return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(m_in_fd, &read_fds);

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    int ready = select(m_in_fd + 1, &read_fds, nullptr, nullptr, &tv);
    if (ready < 0) {
        if (errno == EINTR) return true;
        LOG_ERROR(TAG, "select() failed: %s", strerror(errno));
        m_open = false;
        return false;
    }
    if (ready == 0) {
        return true;
    }

    char chunk[RX_CHUNK_SIZE];
    ssize_t n = read(m_in_fd, chunk, sizeof(chunk));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return true;
        LOG_ERROR(TAG, "read() failed: %s", strerror(errno));
        m_open = false;
        return false;
    }
    if (n == 0) {
        LOG_INFO(TAG, "Input closed");
        if (!m_rx_buffer.empty() && !m_discarding) {
            processLine(m_rx_buffer);
        }
        m_rx_buffer.clear();
        m_open = false;
        return false;
    }

    m_rx_buffer.append(chunk, static_cast<size_t>(n));

    size_t start = 0;
    if (m_discarding) {
        size_t end = m_rx_buffer.find('\n');
        if (end == std::string::npos) {
            m_rx_buffer.clear();
            return m_open;
        }
        start = end + 1;
        m_discarding = false;
    }

    size_t newline;
    while ((newline = m_rx_buffer.find('\n', start)) != std::string::npos) {
        std::string line = m_rx_buffer.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            processLine(line);
        }
        start = newline + 1;
    }
    m_rx_buffer.erase(0, start);

    // The rest of an oversized line is never parsed
    if (m_rx_buffer.size() > RX_BUFFER_LIMIT) {
        LOG_WARN(TAG, "RX line exceeds %d bytes, discarding", RX_BUFFER_LIMIT);
        m_rx_buffer.clear();
        m_discarding = true;
    }

    return m_open;
}

void StdioServer::processLine(const std::string &line) {
    m_lines++;

    std::string response;
    if (m_rpc.handleLine(line, response)) {
        if (!sendLine(response)) {
            LOG_ERROR(TAG, "write() failed: %s", strerror(errno));
            m_open = false;
        }
    }
}

bool StdioServer::sendLine(const std::string &line) {
    std::string msg = line + "\n";
    const char *p = msg.c_str();
    size_t left = msg.size();

    while (left > 0) {
        ssize_t written = write(m_out_fd, p, left);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += written;
        left -= static_cast<size_t>(written);
    }
    return true;
}
