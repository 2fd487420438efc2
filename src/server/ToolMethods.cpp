#include "server/ToolMethods.hpp"

#include <string_view>

namespace server { namespace mcp {

Method getMethodNamed(const char* name, size_t length) {
    struct MethodName {
        std::string_view name;
        Method method;
    };
    static const MethodName kMethodNames[] = {
        { "initialize", kInitialize },
        { "ping", kPing },
        { "tools/list", kToolsList },
        { "tools/call", kToolsCall },
        { "notifications/initialized", kInitialized },
        { "notifications/cancelled", kCancelled },
    };

    std::string_view methodName(name, length);
    for (const auto& entry : kMethodNames) {
        if (entry.name == methodName) {
            return entry.method;
        }
    }
    return kNotFound;
}

} // namespace mcp
} // namespace server
