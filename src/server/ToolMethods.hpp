#ifndef SRC_SERVER_TOOL_METHODS_HPP_
#define SRC_SERVER_TOOL_METHODS_HPP_

#include <cstddef>

namespace server { namespace mcp {

enum Method {
    kNotFound, // no match
    kInitialize,
    kPing,
    kToolsList,
    kToolsCall,
    kInitialized,
    kCancelled,
};

Method getMethodNamed(const char* name, size_t length);

} // namespace mcp
} // namespace server

#endif // SRC_SERVER_TOOL_METHODS_HPP_
