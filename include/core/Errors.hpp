#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace core {

// A single provider search/download failed. Absorbed by the resolver.
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& provider_id, const std::string& msg);

    const std::string& provider_id() const { return m_provider_id; }

private:
    std::string m_provider_id;
};

// No candidate could be downloaded for a company/year.
class ResolutionFailed : public std::runtime_error {
public:
    ResolutionFailed(size_t attempts, const std::string& last_error);

    size_t attempts() const { return m_attempts; }
    const std::string& last_error() const { return m_last_error; }

private:
    size_t m_attempts = 0;
    std::string m_last_error;
};

class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& msg) : std::runtime_error("invalid input: " + msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error("config error: " + msg) {}
};

// Evidence cited by a score is missing from the ranked top-K.
class ParityViolation : public std::runtime_error {
public:
    ParityViolation(const std::string& query, std::vector<std::string> missing_ids);

    const std::vector<std::string>& missing_ids() const { return m_missing_ids; }

private:
    std::vector<std::string> m_missing_ids;
};

// Unit cancelled at a stage boundary; nothing was surfaced.
class Cancelled : public std::runtime_error {
public:
    explicit Cancelled(const std::string& stage) : std::runtime_error("cancelled before " + stage) {}
};

// Short stable name used in error records ("config_error", ...).
std::string error_kind(const std::exception& e);

}  // namespace core
