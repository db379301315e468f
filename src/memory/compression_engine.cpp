#include "memory/compression_engine.hpp"
#include "memory/content_hash.hpp"
#include "storage/memory_storage.hpp"
#include <array>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace memsync::memory {

namespace {

constexpr size_t kLightMinLength = 1000;
constexpr size_t kLightKeepLength = 900;
constexpr size_t kMediumMinLength = 500;
constexpr size_t kMediumMinSentences = 6;
constexpr size_t kHighMinLength = 300;
constexpr size_t kExtremeMinLength = 100;

constexpr size_t kLightKeepKeys = 5;
constexpr size_t kMediumKeepKeys = 3;

const char* const kCompressedFlag = "_compressed";
const char* const kKeysField = "_keys";

std::vector<std::string> split(const std::string& text, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + delim.size();
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delim) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delim;
        out += parts[i];
    }
    return out;
}

// Cut at max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::string light_text(const std::string& text, const std::string&) {
    if (text.size() <= kLightMinLength) return text;
    return truncate_utf8(text, kLightKeepLength) + "... [compressed]";
}

std::string medium_text(const std::string& text, const std::string&) {
    if (text.size() <= kMediumMinLength) return text;
    auto sentences = split(text, ". ");
    if (sentences.size() < kMediumMinSentences) return text;

    size_t n = sentences.size();
    return join({sentences[0], sentences[1], "...", sentences[n - 2], sentences[n - 1]}, ". ");
}

std::string high_text(const std::string& text, const std::string&) {
    if (text.size() <= kHighMinLength) return text;
    auto paragraphs = split(text, "\n\n");
    if (paragraphs.size() <= 2) return text;
    return paragraphs.front() + "\n\n... [highly compressed] ...\n\n" + paragraphs.back();
}

std::string extreme_text(const std::string& text, const std::string&) {
    if (text.size() <= kExtremeMinLength) return text;
    return split(text, "\n\n").front() + " ... [extremely compressed]";
}

std::string reference_text(const std::string&, const std::string& hash) {
    return CompressionEngine::reference_string(hash);
}

// Keys carrying data, ignoring the markers earlier rungs added
std::vector<std::string> data_keys(const json& object) {
    std::vector<std::string> keys;
    if (object.contains(kKeysField) && object[kKeysField].is_array()) {
        for (const auto& k : object[kKeysField]) {
            if (k.is_string()) keys.push_back(k.get<std::string>());
        }
        return keys;
    }
    for (const auto& item : object.items()) {
        if (item.key() != kCompressedFlag) keys.push_back(item.key());
    }
    return keys;
}

bool is_key_list(const json& object) {
    return object.contains(kKeysField);
}

json keep_first_keys(const json& object, size_t count, bool always_flag) {
    if (is_key_list(object)) return object;

    auto keys = data_keys(object);
    bool dropped = keys.size() > count;
    if (!dropped && !always_flag) return object;

    json out = json::object();
    for (size_t i = 0; i < keys.size() && i < count; ++i) {
        out[keys[i]] = object[keys[i]];
    }
    out[kCompressedFlag] = true;
    return out;
}

json light_object(const json& object) {
    return keep_first_keys(object, kLightKeepKeys, false);
}

json medium_object(const json& object) {
    return keep_first_keys(object, kMediumKeepKeys, true);
}

json key_names_object(const json& object) {
    json out = json::object();
    out[kCompressedFlag] = true;
    out[kKeysField] = data_keys(object);
    return out;
}

struct LevelStrategy {
    CompressionLevel level;
    std::string (*on_text)(const std::string& text, const std::string& content_hash);
    json (*on_object)(const json& object);
};

const std::array<LevelStrategy, 5> kLadder = {{
    {CompressionLevel::LIGHT,          light_text,     light_object},
    {CompressionLevel::MEDIUM,         medium_text,    medium_object},
    {CompressionLevel::HIGH,           high_text,      key_names_object},
    {CompressionLevel::EXTREME,        extreme_text,   key_names_object},
    {CompressionLevel::REFERENCE_ONLY, reference_text, key_names_object},
}};

} // namespace

MemoryEntry CompressionEngine::compress(const MemoryEntry& entry, CompressionLevel level) {
    MemoryEntry result = entry;
    if (level <= entry.compression_level) {
        return result;
    }

    if (!entry.content.is_string() && !entry.content.is_object()) {
        throw CompressionError(std::string("cannot compress content of type ") +
                               entry.content.type_name());
    }

    std::string hash = entry.metadata.content_hash.empty()
        ? content_hash(entry.content)
        : entry.metadata.content_hash;

    for (const auto& step : kLadder) {
        if (step.level <= entry.compression_level || step.level > level) {
            continue;
        }

        if (result.content.is_string()) {
            const auto& text = result.content.get_ref<const std::string&>();
            std::string reduced = step.on_text(text, hash);
            if (step.level == CompressionLevel::REFERENCE_ONLY || reduced.size() < text.size()) {
                result.content = std::move(reduced);
            }
        } else {
            result.content = step.on_object(result.content);
        }
    }

    result.compression_level = level;
    return result;
}

std::optional<MemoryEntry> CompressionEngine::decompress(const MemoryEntry& entry,
                                                         storage::MemoryStorage& storage) {
    if (entry.compression_level == CompressionLevel::NONE) {
        return entry;
    }

    if (entry.compression_level != CompressionLevel::REFERENCE_ONLY) {
        spdlog::debug("Compression level {} is lossy, cannot restore",
                      compression_level_to_string(entry.compression_level));
        return std::nullopt;
    }

    auto original = storage.get_by_hash(entry.metadata.content_hash);
    if (!original) {
        spdlog::warn("No stored content for reference {}", entry.metadata.content_hash);
        return std::nullopt;
    }

    MemoryEntry restored = entry;
    restored.content = original->content;
    restored.compression_level = CompressionLevel::NONE;
    return restored;
}

const std::vector<CompressionLevel>& CompressionEngine::escalation_levels() {
    static const std::vector<CompressionLevel> levels = {
        CompressionLevel::LIGHT,
        CompressionLevel::MEDIUM,
        CompressionLevel::HIGH,
        CompressionLevel::EXTREME,
        CompressionLevel::REFERENCE_ONLY
    };
    return levels;
}

std::string CompressionEngine::reference_string(const std::string& content_hash) {
    return "[Reference: memory with hash " + content_hash + "]";
}

} // namespace memsync::memory
