#include "core/Errors.hpp"

#include <sstream>

namespace core {

ProviderError::ProviderError(const std::string& provider_id, const std::string& msg)
    : std::runtime_error("provider " + provider_id + ": " + msg),
      m_provider_id(provider_id) {}

static std::string resolution_message(size_t attempts, const std::string& last_error) {
    std::ostringstream oss;
    if (attempts == 0) {
        oss << "no candidates found";
    } else {
        oss << "all " << attempts << " download attempts failed";
    }
    if (!last_error.empty()) oss << "; last error: " << last_error;
    return oss.str();
}

ResolutionFailed::ResolutionFailed(size_t attempts, const std::string& last_error)
    : std::runtime_error(resolution_message(attempts, last_error)),
      m_attempts(attempts),
      m_last_error(last_error) {}

static std::string parity_message(const std::string& query, const std::vector<std::string>& missing) {
    std::ostringstream oss;
    oss << "parity violation for query '" << query << "': " << missing.size()
        << " evidence id(s) not in top-k [";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i) oss << ", ";
        oss << missing[i];
    }
    oss << "]";
    return oss.str();
}

ParityViolation::ParityViolation(const std::string& query, std::vector<std::string> missing_ids)
    : std::runtime_error(parity_message(query, missing_ids)),
      m_missing_ids(std::move(missing_ids)) {}

std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const ConfigError*>(&e)) return "config_error";
    if (dynamic_cast<const InvalidInput*>(&e)) return "invalid_input";
    if (dynamic_cast<const ResolutionFailed*>(&e)) return "resolution_failed";
    if (dynamic_cast<const ParityViolation*>(&e)) return "parity_violation";
    if (dynamic_cast<const ProviderError*>(&e)) return "provider_error";
    if (dynamic_cast<const Cancelled*>(&e)) return "cancelled";
    return "internal_error";
}

}  // namespace core
