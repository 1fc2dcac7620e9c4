#include "adapters/adapter_factory.h"
#include "adapters/codex_cli_adapter.h"
#include "adapters/gemini_cli_adapter.h"

namespace mcpaudit {

std::unique_ptr<IPlatformAdapter> create_adapter(Platform platform) {
    switch (platform) {
        case Platform::CodexCli:  return std::make_unique<CodexCliAdapter>();
        case Platform::GeminiCli: return std::make_unique<GeminiCliAdapter>();
    }
    return nullptr;
}

const char* platform_name(Platform platform) {
    switch (platform) {
        case Platform::CodexCli:  return "codex-cli";
        case Platform::GeminiCli: return "gemini-cli";
    }
    return "unknown";
}

std::optional<Platform> parse_platform(const std::string& name) {
    if (name == "codex-cli" || name == "codex") return Platform::CodexCli;
    if (name == "gemini-cli" || name == "gemini") return Platform::GeminiCli;
    return std::nullopt;
}

}
