#include "memory/content_hash.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace memsync::memory {

std::string canonical_dump(const nlohmann::json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    return content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string content_hash(const nlohmann::json& content) {
    // Strings are hashed quoted so a string never collides with an object
    // whose dump has the same text
    std::string data = content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace memsync::memory
