#pragma once

#include <kaizen_mcp/api/i_remote_executor.hpp>

#include <chrono>

namespace kaizen_mcp {

// ---------------------------------------------------------------------------
// ServerContext: process-wide state shared by every request.
//
// Built once in main() and passed by reference. The executor is used
// sequentially and is never reconfigured after startup.
// ---------------------------------------------------------------------------
struct ServerContext {
    IRemoteExecutor& executor;
    std::chrono::milliseconds call_timeout{std::chrono::seconds(60)};
};

} // namespace kaizen_mcp
