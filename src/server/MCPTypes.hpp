#ifndef SRC_SERVER_MCP_TYPES_HPP_
#define SRC_SERVER_MCP_TYPES_HPP_

#include <cstdint>
#include <string>
#include <variant>

namespace server {
namespace mcp {

using ID = std::variant<int64_t, std::string>;

// MCP revision spoken by the tool server.
constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace mcp
} // namespace server

#endif // SRC_SERVER_MCP_TYPES_HPP_
