#include "sync/adapter_registry.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace memsync::sync {

bool AdapterRegistry::register_adapter(std::shared_ptr<ToolAdapter> adapter) {
    if (!adapter) {
        return false;
    }

    std::string name = adapter->tool_name();
    if (name.empty()) {
        spdlog::error("Refusing to register adapter with empty tool name");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (adapters_.count(name)) {
        spdlog::warn("Replacing adapter for {}", name);
    }
    adapters_[name] = std::move(adapter);
    spdlog::info("Registered tool adapter: {}", name);
    return true;
}

bool AdapterRegistry::unregister_adapter(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.erase(tool) > 0;
}

std::shared_ptr<ToolAdapter> AdapterRegistry::find(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(tool);
    return (it != adapters_.end()) ? it->second : nullptr;
}

std::vector<std::string> AdapterRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& [name, adapter] : adapters_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::shared_ptr<ToolAdapter>> AdapterRegistry::adapters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<ToolAdapter>> result;
    result.reserve(adapters_.size());
    for (const auto& [name, adapter] : adapters_) {
        result.push_back(adapter);
    }
    return result;
}

std::vector<std::string> AdapterRegistry::targets_for(const std::string& origin) const {
    auto names = tool_names();
    names.erase(std::remove(names.begin(), names.end(), origin), names.end());
    return names;
}

} // namespace memsync::sync
