#ifndef STDIO_SERVER_HPP
#define STDIO_SERVER_HPP

#include <string>
#include <cstdint>

#include "json_rpc.hpp"

/**
 * StdioServer - Line-framed JSON-RPC over a pair of file descriptors
 *
 * One message per line in, one reply per line out. Defaults to
 * stdin/stdout; tests pass pipe ends.
 */
class StdioServer {
public:
    StdioServer(JsonRpc &rpc, int in_fd = 0, int out_fd = 1);

    /**
     * Wait up to timeout_ms for input and handle complete lines.
     * Returns false once input has closed or failed.
     */
    bool tick(int timeout_ms);

    bool isOpen() const { return m_open; }
    uint32_t getLinesHandled() const { return m_lines; }

private:
    void processLine(const std::string &line);
    bool sendLine(const std::string &line);

    JsonRpc &m_rpc;
    int m_in_fd;
    int m_out_fd;
    bool m_open = true;
    // Set after an oversized line; input is dropped up to its newline
    bool m_discarding = false;

    std::string m_rx_buffer;
    uint32_t m_lines = 0;
};

#endif // STDIO_SERVER_HPP
