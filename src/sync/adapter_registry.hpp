#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "sync/tool_adapter.hpp"

namespace memsync::sync {

// Consumer name -> adapter table, filled at startup.
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    bool register_adapter(std::shared_ptr<ToolAdapter> adapter);
    bool unregister_adapter(const std::string& tool);

    std::shared_ptr<ToolAdapter> find(const std::string& tool) const;
    std::vector<std::string> tool_names() const;
    std::vector<std::shared_ptr<ToolAdapter>> adapters() const;

    // Every registered consumer except `origin`
    std::vector<std::string> targets_for(const std::string& origin) const;

private:
    std::unordered_map<std::string, std::shared_ptr<ToolAdapter>> adapters_;
    mutable std::mutex mutex_;
};

} // namespace memsync::sync
