#include "core/canonical_event.h"
#include <cstdio>

namespace mcpaudit {

std::optional<McpToolName> split_mcp_tool_name(const std::string& tool_name) {
    const std::string prefix = kMcpPrefix;
    if (tool_name.size() <= prefix.size() || tool_name.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    auto sep = tool_name.find("__", prefix.size());
    if (sep == std::string::npos || sep == prefix.size()) {
        return std::nullopt;
    }

    McpToolName name;
    name.server = tool_name.substr(prefix.size(), sep - prefix.size());
    name.tool = tool_name.substr(sep + 2);
    if (name.tool.empty()) {
        return std::nullopt;
    }
    return name;
}

std::string event_tool_name(const CanonicalEvent& event) {
    if (const auto* call = std::get_if<ToolCallEvent>(&event)) {
        return call->tool_name;
    }
    return kSessionSentinel;
}

std::string compute_content_signature(const nlohmann::json& parameters) {
    // nlohmann::json keeps object keys sorted, so dump() is canonical.
    const std::string canonical = parameters.dump();

    uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : canonical) {
        hash ^= c;
        hash *= 1099511628211ull;
    }

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

ToolCallEvent make_tool_call_event(const std::string& tool_name, const nlohmann::json& parameters) {
    ToolCallEvent event;
    event.tool_name = tool_name;
    if (auto name = split_mcp_tool_name(tool_name)) {
        event.server = name->server;
    }
    event.parameters = parameters.is_null() ? nlohmann::json::object() : parameters;
    if (!event.parameters.empty()) {
        event.content_signature = compute_content_signature(event.parameters);
    }
    return event;
}

}
