#ifndef HOMEIO_TOOL_PROTOCOL_H
#define HOMEIO_TOOL_PROTOCOL_H

/**
 * HomeIO - Tool protocol constants
 *
 * JSON-RPC 2.0 framing, one message per line on stdin/stdout.
 * Method set follows the Model Context Protocol tool API.
 */

#define TOOL_PROTOCOL_VERSION   "2024-11-05"
#define JSONRPC_VERSION         "2.0"

#define SERVER_NAME_DEFAULT     "homeio-gpio"
#define SERVER_VERSION          "1.0.0"

// Hard-failure error codes (JSON-RPC error channel)
#define RPC_ERR_PARSE           (-32700)
#define RPC_ERR_INVALID_REQUEST (-32600)
#define RPC_ERR_METHOD_NOT_FOUND (-32601)
#define RPC_ERR_INVALID_PARAMS  (-32602)
#define RPC_ERR_INTERNAL        (-32603)

// Tool names
#define TOOL_GPIO_READ_PIN      "gpio_read_pin"
#define TOOL_GPIO_WRITE_PIN     "gpio_write_pin"
#define TOOL_GPIO_SETUP_PIN     "gpio_setup_pin"
#define TOOL_GPIO_LIST_PINS     "gpio_list_pins"
#define TOOL_CONTROL_LIGHT      "control_light"
#define TOOL_CONTROL_PUMP       "control_pump"

#endif // HOMEIO_TOOL_PROTOCOL_H
