#pragma once

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief Cleans user text before it reaches adapters, caches or logs
 */
class ISanitizer {
public:
    virtual ~ISanitizer() = default;
    virtual std::string sanitize(std::string_view text) const = 0;
};

/**
 * @brief Live tracing span; ends when destroyed
 */
class ITraceSpan {
public:
    virtual ~ITraceSpan() = default;
    virtual void setAttribute(std::string_view key, std::string_view value) = 0;
    virtual void setError(std::string_view message) = 0;
};

/**
 * @brief Wraps named sections of the pipeline for observability
 */
class ITracer {
public:
    virtual ~ITracer() = default;
    virtual std::unique_ptr<ITraceSpan> startSpan(std::string_view operation) = 0;
};

/// Returns the input unchanged apart from UTF-8 repair.
class PassthroughSanitizer final : public ISanitizer {
public:
    std::string sanitize(std::string_view text) const override;
};

/**
 * @brief Default sanitizer: redacts credentials and personal data
 *
 * Repairs invalid UTF-8, replaces control characters, redacts access keys,
 * API tokens, credentialed connection strings, JWTs, password assignments and
 * e-mail addresses, collapses whitespace and bounds the result length.
 */
class RedactingSanitizer final : public ISanitizer {
public:
    static constexpr size_t kMaxLength = 1000;
    static constexpr std::string_view kRedacted = "[REDACTED]";

    RedactingSanitizer();

    std::string sanitize(std::string_view text) const override;

private:
    std::vector<std::regex> patterns_;
};

class NoopTracer final : public ITracer {
public:
    std::unique_ptr<ITraceSpan> startSpan(std::string_view operation) override;
};

/// Emits span durations and attributes through spdlog at debug level.
class LoggingTracer final : public ITracer {
public:
    std::unique_ptr<ITraceSpan> startSpan(std::string_view operation) override;
};

} // namespace beacon::retrieval
