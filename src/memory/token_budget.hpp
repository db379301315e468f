#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "memory/types.hpp"

namespace memsync::memory {

struct KeyedEntry {
    std::string key;
    MemoryEntry entry;
};

struct AdmittedEntry {
    std::string key;
    MemoryEntry entry;   // possibly compressed
    int64_t tokens = 0;
};

struct OptimizationResult {
    std::vector<AdmittedEntry> admitted;
    std::vector<std::string> dropped;   // keys that fit at no level
    int64_t tokens_admitted = 0;
};

// Outcome of escalating an entry through the ladder against a budget
struct FitResult {
    MemoryEntry entry;   // first fitting variant, else the smallest one produced
    int64_t tokens = 0;
    bool fits = false;
};

/**
 * Per-consumer token accounting.
 *
 * Usage is clamped at zero on release and only grows through admissions
 * that fit, so it never exceeds the ceiling. Consumers without a ceiling
 * cannot admit anything.
 */
class TokenBudgetManager {
public:
    static constexpr int64_t kCharsPerToken = 4;

    TokenBudgetManager() = default;
    explicit TokenBudgetManager(const std::map<std::string, int64_t>& ceilings);

    void set_budget(const std::string& tool, int64_t ceiling);
    bool has_budget(const std::string& tool) const;

    static int64_t estimate_tokens(const MemoryEntry& entry);

    bool can_fit(const MemoryEntry& entry, const std::string& tool) const;
    bool admit(const MemoryEntry& entry, const std::string& tool);
    void release(const MemoryEntry& entry, const std::string& tool);
    void reset_usage(const std::string& tool);

    int64_t ceiling(const std::string& tool) const;
    int64_t usage(const std::string& tool) const;
    int64_t available(const std::string& tool) const;
    std::map<std::string, int64_t> usage_snapshot() const;

    // Tries the entry as-is, then each compression level in ascending order.
    // Levels whose compression throws are skipped.
    static FitResult fit_to_budget(const MemoryEntry& entry, int64_t budget);

    // Sorts by (priority, context_relevance) descending, then admits greedily
    OptimizationResult optimize_for_tool(std::vector<KeyedEntry> entries, const std::string& tool);

    // Greedy fit-or-compress admission in the given order
    OptimizationResult admit_in_order(const std::vector<KeyedEntry>& entries, const std::string& tool);

private:
    struct Budget {
        int64_t ceiling = 0;
        int64_t used = 0;
    };

    std::unordered_map<std::string, Budget> budgets_;
    mutable std::mutex mutex_;
};

} // namespace memsync::memory
