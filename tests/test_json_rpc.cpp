/**
 * JSON-RPC Unit Tests
 *
 * Request handling and line framing over pipes.
 */

#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <unistd.h>
#include <fcntl.h>
#include "../homeio_daemon/error_handler.hpp"
#include "../homeio_daemon/gpio_tools.hpp"
#include "../homeio_daemon/json_rpc.hpp"
#include "../homeio_daemon/light_controller.hpp"
#include "../homeio_daemon/logger.h"
#include "../homeio_daemon/stdio_server.hpp"
#include "../homeio_daemon/tool_dispatcher.hpp"
#include "mocks/mock_gpio_backend.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

using json = nlohmann::json;

struct Fixture {
    MockGpioBackend gpio;
    ErrorHandler errors;
    ToolDispatcher dispatcher;
    GpioTools gpio_tools;
    LightController lights;
    JsonRpc rpc;

    Fixture()
        : dispatcher(errors), gpio_tools(gpio), lights(gpio),
          rpc(dispatcher, SERVER_NAME_DEFAULT) {
        gpio_tools.registerTools(dispatcher);
        lights.registerTools(dispatcher);
    }

    // Returns the parsed reply, or null when none was sent
    json request(const std::string &line) {
        std::string response;
        if (!rpc.handleLine(line, response)) {
            return json();
        }
        return json::parse(response);
    }
};

void test_initialize() {
    TEST("initialize returns server info and tool capability");

    Fixture f;
    json reply = f.request(R"({"jsonrpc":"2.0","id":1,"method":"initialize",
        "params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"test"}}})");

    bool ok = reply["jsonrpc"] == "2.0" && reply["id"] == 1;
    ok = ok && reply["result"]["protocolVersion"] == TOOL_PROTOCOL_VERSION;
    ok = ok && reply["result"]["serverInfo"]["name"] == "homeio-gpio";
    ok = ok && reply["result"]["serverInfo"]["version"] == SERVER_VERSION;
    ok = ok && reply["result"]["capabilities"].contains("tools");
    ok = ok && f.rpc.isInitialized();

    if (ok) {
        PASS();
    } else {
        FAIL(reply.dump().c_str());
    }
}

void test_notification_no_reply() {
    TEST("Notifications get no reply");

    Fixture f;
    std::string response;
    bool replied = f.rpc.handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", response);
    bool replied_call = f.rpc.handleLine(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"gpio_write_pin","arguments":{"pin":3,"value":1}}})",
        response);

    bool ok = !replied && !replied_call && f.rpc.isInitialized();
    // Notifications are not executed
    ok = ok && f.gpio.getWriteCount() == 0;
    ok = ok && f.rpc.getRequestCount() == 0;

    if (ok) {
        PASS();
    } else {
        FAIL("Reply sent for notification");
    }
}

void test_ping_and_list() {
    TEST("ping and tools/list");

    Fixture f;
    json pong = f.request(R"({"jsonrpc":"2.0","id":"a","method":"ping"})");
    json list = f.request(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");

    bool ok = pong["id"] == "a" && pong["result"] == json::object();
    ok = ok && list["result"]["tools"].size() == 5;
    ok = ok && list["result"]["tools"][0]["name"] == TOOL_GPIO_READ_PIN;
    ok = ok && f.rpc.getRequestCount() == 2;

    if (ok) {
        PASS();
    } else {
        FAIL(list.dump().c_str());
    }
}

void test_tools_call_success() {
    TEST("tools/call success wraps text content");

    Fixture f;
    json reply = f.request(R"({"jsonrpc":"2.0","id":7,"method":"tools/call",
        "params":{"name":"gpio_write_pin","arguments":{"pin":17,"value":1}}})");

    json content = reply["result"]["content"];
    bool ok = reply["id"] == 7 && content.size() == 1;
    ok = ok && content[0]["type"] == "text";
    ok = ok && content[0]["text"] == "GPIO pin 17 set to HIGH (1)";
    ok = ok && !reply["result"].contains("isError");

    if (ok) {
        PASS();
    } else {
        FAIL(reply.dump().c_str());
    }
}

void test_tools_call_soft_error() {
    TEST("tools/call soft failure sets isError");

    Fixture f;
    json reply = f.request(R"({"jsonrpc":"2.0","id":8,"method":"tools/call",
        "params":{"name":"control_light","arguments":{"action":"dim","pin":18}}})");

    bool ok = reply.contains("result") && !reply.contains("error");
    ok = ok && reply["result"]["isError"] == true;
    ok = ok && reply["result"]["content"][0]["text"] == "Brightness value required for dimming";

    if (ok) {
        PASS();
    } else {
        FAIL(reply.dump().c_str());
    }
}

void test_tools_call_errors() {
    TEST("tools/call error codes");

    Fixture f;
    json unknown = f.request(R"({"jsonrpc":"2.0","id":1,"method":"tools/call",
        "params":{"name":"gpio_explode","arguments":{}}})");
    json invalid = f.request(R"({"jsonrpc":"2.0","id":2,"method":"tools/call",
        "params":{"name":"gpio_read_pin","arguments":{"pin":41}}})");
    json missing = f.request(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{}})");

    f.gpio.setFailReads(true);
    json internal = f.request(R"({"jsonrpc":"2.0","id":4,"method":"tools/call",
        "params":{"name":"gpio_read_pin","arguments":{"pin":4}}})");

    bool ok = unknown["error"]["code"] == RPC_ERR_METHOD_NOT_FOUND;
    ok = ok && unknown["error"]["message"] == "Unknown tool: gpio_explode";
    ok = ok && invalid["error"]["code"] == RPC_ERR_INVALID_PARAMS;
    ok = ok && invalid["id"] == 2;
    ok = ok && missing["error"]["code"] == RPC_ERR_INVALID_PARAMS;
    ok = ok && missing["error"]["message"] == "Missing tool name";
    ok = ok && internal["error"]["code"] == RPC_ERR_INTERNAL;
    ok = ok && internal["error"]["message"].get<std::string>().find("Tool execution failed: ") == 0;

    if (ok) {
        PASS();
    } else {
        FAIL(internal.dump().c_str());
    }
}

void test_malformed_messages() {
    TEST("Parse error, invalid request, unknown method");

    Fixture f;
    json parse = f.request("{not json");
    json array = f.request("[1,2,3]");
    json bad_id = f.request(R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})");
    json no_method = f.request(R"({"jsonrpc":"2.0","id":5})");
    json unknown = f.request(R"({"jsonrpc":"2.0","id":6,"method":"resources/list"})");

    bool ok = parse["error"]["code"] == RPC_ERR_PARSE && parse["id"].is_null();
    ok = ok && array["error"]["code"] == RPC_ERR_INVALID_REQUEST;
    ok = ok && bad_id["error"]["code"] == RPC_ERR_INVALID_REQUEST;
    ok = ok && no_method["error"]["code"] == RPC_ERR_INVALID_REQUEST && no_method["id"] == 5;
    ok = ok && unknown["error"]["code"] == RPC_ERR_METHOD_NOT_FOUND;
    ok = ok && unknown["error"]["message"] == "Method not found: resources/list";

    if (ok) {
        PASS();
    } else {
        FAIL("Malformed message handling incorrect");
    }
}

void test_create_responses() {
    TEST("Create result/error responses");

    std::string result = JsonRpc::createResultResponse(3, {{"ok", true}});
    std::string error = JsonRpc::createErrorResponse(nullptr, RPC_ERR_PARSE, "Parse error");

    bool ok = true;
    ok = ok && (result.find("\"jsonrpc\":\"2.0\"") != std::string::npos);
    ok = ok && (result.find("\"id\":3") != std::string::npos);
    ok = ok && (error.find("\"id\":null") != std::string::npos);
    ok = ok && (error.find("\"code\":-32700") != std::string::npos);
    // One message per line
    ok = ok && result.find('\n') == std::string::npos;

    if (ok) {
        PASS();
    } else {
        FAIL("Response format incorrect");
    }
}

/**
 * Pipes standing in for stdin/stdout.
 */
struct PipePair {
    int in[2] = {-1, -1};
    int out[2] = {-1, -1};

    bool open() {
        if (pipe(in) != 0 || pipe(out) != 0) return false;
        fcntl(out[0], F_SETFL, O_NONBLOCK);
        return true;
    }

    ~PipePair() {
        for (int fd : {in[0], in[1], out[0], out[1]}) {
            if (fd >= 0) close(fd);
        }
    }

    void send(const std::string &data) {
        ssize_t n = write(in[1], data.data(), data.size());
        (void)n;
    }

    void closeInput() {
        close(in[1]);
        in[1] = -1;
    }

    std::string receive() {
        std::string data;
        char buf[4096];
        ssize_t n;
        while ((n = read(out[0], buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<size_t>(n));
        }
        return data;
    }
};

void test_stdio_framing() {
    TEST("Stdio server frames lines, including split and CRLF input");

    Fixture f;
    PipePair pipes;
    if (!pipes.open()) {
        FAIL("pipe() failed");
        return;
    }
    StdioServer server(f.rpc, pipes.in[0], pipes.out[1]);

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":1,\"meth");
    server.tick(50);
    bool ok = pipes.receive().empty();

    pipes.send("od\":\"ping\"}\r\n\n{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    server.tick(50);

    std::string out = pipes.receive();
    size_t first = out.find('\n');
    ok = ok && first != std::string::npos;
    if (ok) {
        json r1 = json::parse(out.substr(0, first));
        json r2 = json::parse(out.substr(first + 1));
        ok = r1["id"] == 1 && r2["id"] == 2;
    }
    // Blank line skipped
    ok = ok && server.getLinesHandled() == 2;

    if (ok) {
        PASS();
    } else {
        FAIL(out.c_str());
    }
}

void test_stdio_eof() {
    TEST("Stdio server handles trailing line at EOF and closes");

    Fixture f;
    PipePair pipes;
    if (!pipes.open()) {
        FAIL("pipe() failed");
        return;
    }
    StdioServer server(f.rpc, pipes.in[0], pipes.out[1]);

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":9,\"method\":\"ping\"}");
    pipes.closeInput();

    bool running = true;
    for (int i = 0; i < 10 && running; i++) {
        running = server.tick(50);
    }

    std::string out = pipes.receive();
    bool ok = !running && !server.isOpen();
    ok = ok && out.find("\"id\":9") != std::string::npos;

    if (ok) {
        PASS();
    } else {
        FAIL("EOF handling incorrect");
    }
}

void test_stdio_oversized_line() {
    TEST("Oversized line dropped through its newline, next line handled");

    Fixture f;
    PipePair pipes;
    if (!pipes.open()) {
        FAIL("pipe() failed");
        return;
    }
    StdioServer server(f.rpc, pipes.in[0], pipes.out[1]);

    // Blocks on the pipe until the server drains it
    std::thread writer([&pipes]() {
        pipes.send(std::string(1536 * 1024, 'x') + "\n");
        pipes.send("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    });

    std::string out;
    for (int i = 0; i < 2000 && out.find("\"id\":2") == std::string::npos; i++) {
        server.tick(20);
        out += pipes.receive();
    }
    writer.join();

    bool ok = out.find("\"id\":2") != std::string::npos;
    ok = ok && out.find("-32700") == std::string::npos;
    ok = ok && server.getLinesHandled() == 1 && server.isOpen();

    if (ok) {
        PASS();
    } else {
        FAIL(out.c_str());
    }
}

int main() {
    printf("=== JSON-RPC Tests ===\n");

    Logger::instance().setLevel(LogLevel::OFF);

    test_initialize();
    test_notification_no_reply();
    test_ping_and_list();
    test_tools_call_success();
    test_tools_call_soft_error();
    test_tools_call_errors();
    test_malformed_messages();
    test_create_responses();
    test_stdio_framing();
    test_stdio_eof();
    test_stdio_oversized_line();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
