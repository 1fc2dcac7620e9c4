#pragma once

#include "adapters/platform_adapter.h"
#include <memory>

namespace mcpaudit {

std::unique_ptr<IPlatformAdapter> create_adapter(Platform platform);

}
