#include "memory/token_budget.hpp"
#include "memory/compression_engine.hpp"
#include "memory/content_hash.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace memsync::memory {

TokenBudgetManager::TokenBudgetManager(const std::map<std::string, int64_t>& ceilings) {
    for (const auto& [tool, ceiling] : ceilings) {
        budgets_[tool].ceiling = std::max<int64_t>(0, ceiling);
    }
}

void TokenBudgetManager::set_budget(const std::string& tool, int64_t ceiling) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& budget = budgets_[tool];
    budget.ceiling = std::max<int64_t>(0, ceiling);
    budget.used = std::min(budget.used, budget.ceiling);
    spdlog::debug("Token budget for {} set to {}", tool, budget.ceiling);
}

bool TokenBudgetManager::has_budget(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budgets_.count(tool) > 0;
}

int64_t TokenBudgetManager::estimate_tokens(const MemoryEntry& entry) {
    auto length = static_cast<int64_t>(canonical_dump(entry.content).size());
    return (length + kCharsPerToken - 1) / kCharsPerToken;
}

bool TokenBudgetManager::can_fit(const MemoryEntry& entry, const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    if (it == budgets_.end()) {
        return false;
    }
    return it->second.used + estimate_tokens(entry) <= it->second.ceiling;
}

bool TokenBudgetManager::admit(const MemoryEntry& entry, const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    if (it == budgets_.end()) {
        return false;
    }

    int64_t tokens = estimate_tokens(entry);
    if (it->second.used + tokens > it->second.ceiling) {
        return false;
    }
    it->second.used += tokens;
    return true;
}

void TokenBudgetManager::release(const MemoryEntry& entry, const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    if (it == budgets_.end()) {
        return;
    }
    it->second.used = std::max<int64_t>(0, it->second.used - estimate_tokens(entry));
}

void TokenBudgetManager::reset_usage(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    if (it != budgets_.end()) {
        it->second.used = 0;
    }
}

int64_t TokenBudgetManager::ceiling(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    return it == budgets_.end() ? 0 : it->second.ceiling;
}

int64_t TokenBudgetManager::usage(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    return it == budgets_.end() ? 0 : it->second.used;
}

int64_t TokenBudgetManager::available(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    if (it == budgets_.end()) {
        return 0;
    }
    return it->second.ceiling - it->second.used;
}

std::map<std::string, int64_t> TokenBudgetManager::usage_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, int64_t> snapshot;
    for (const auto& [tool, budget] : budgets_) {
        snapshot[tool] = budget.used;
    }
    return snapshot;
}

FitResult TokenBudgetManager::fit_to_budget(const MemoryEntry& entry, int64_t budget) {
    FitResult result;
    result.entry = entry;
    result.tokens = estimate_tokens(entry);
    if (result.tokens <= budget) {
        result.fits = true;
        return result;
    }

    bool compressed_any = false;
    for (auto level : CompressionEngine::escalation_levels()) {
        if (level <= entry.compression_level) {
            continue;
        }

        MemoryEntry candidate;
        try {
            candidate = CompressionEngine::compress(entry, level);
        } catch (const CompressionError& e) {
            spdlog::warn("Compression at level {} failed: {}", compression_level_to_string(level), e.what());
            continue;
        }

        compressed_any = true;
        int64_t tokens = estimate_tokens(candidate);
        spdlog::debug("Compressed to {}: {} -> {} tokens (budget {})",
                      compression_level_to_string(level), estimate_tokens(entry), tokens, budget);

        result.entry = std::move(candidate);
        result.tokens = tokens;
        if (tokens <= budget) {
            result.fits = true;
            return result;
        }
    }

    if (!compressed_any) {
        spdlog::warn("No compression level applicable, keeping entry uncompressed");
    }
    return result;
}

OptimizationResult TokenBudgetManager::optimize_for_tool(std::vector<KeyedEntry> entries,
                                                         const std::string& tool) {
    std::stable_sort(entries.begin(), entries.end(), [](const KeyedEntry& a, const KeyedEntry& b) {
        if (a.entry.priority != b.entry.priority) {
            return a.entry.priority > b.entry.priority;
        }
        return a.entry.metadata.context_relevance > b.entry.metadata.context_relevance;
    });
    return admit_in_order(entries, tool);
}

OptimizationResult TokenBudgetManager::admit_in_order(const std::vector<KeyedEntry>& entries,
                                                      const std::string& tool) {
    OptimizationResult result;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(tool);
    if (it == budgets_.end()) {
        spdlog::warn("No token budget configured for {}", tool);
        for (const auto& candidate : entries) {
            result.dropped.push_back(candidate.key);
        }
        return result;
    }

    auto& budget = it->second;
    for (const auto& candidate : entries) {
        auto fit = fit_to_budget(candidate.entry, budget.ceiling - budget.used);
        if (!fit.fits) {
            spdlog::info("Entry {} does not fit {}'s budget at any level, dropped", candidate.key, tool);
            result.dropped.push_back(candidate.key);
            continue;
        }

        budget.used += fit.tokens;
        result.tokens_admitted += fit.tokens;
        result.admitted.push_back(AdmittedEntry{candidate.key, std::move(fit.entry), fit.tokens});
    }

    return result;
}

} // namespace memsync::memory
