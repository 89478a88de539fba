#include <beacon/common/utf8_utils.h>
#include <beacon/retrieval/collaborators.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <map>

namespace beacon::retrieval {

namespace {

std::string collapseWhitespace(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    bool pendingSpace = false;
    for (unsigned char c : in) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

class LoggingSpan final : public ITraceSpan {
public:
    explicit LoggingSpan(std::string operation)
        : operation_(std::move(operation)), start_(std::chrono::steady_clock::now()) {}

    ~LoggingSpan() override {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - start_)
                           .count();
        std::string attrs;
        for (const auto& [k, v] : attributes_) {
            attrs += " " + k + "=" + v;
        }
        if (error_.empty()) {
            spdlog::debug("[trace] {} took {}us{}", operation_, elapsed, attrs);
        } else {
            spdlog::debug("[trace] {} failed after {}us: {}{}", operation_, elapsed, error_, attrs);
        }
    }

    void setAttribute(std::string_view key, std::string_view value) override {
        attributes_[std::string(key)] = std::string(value);
    }

    void setError(std::string_view message) override { error_ = std::string(message); }

private:
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
    std::map<std::string, std::string> attributes_;
    std::string error_;
};

} // namespace

std::string PassthroughSanitizer::sanitize(std::string_view text) const {
    return common::sanitizeUtf8(text);
}

RedactingSanitizer::RedactingSanitizer() {
    const auto icase = std::regex::ECMAScript | std::regex::icase;
    patterns_.emplace_back(R"(AKIA[0-9A-Z]{16})");
    patterns_.emplace_back(R"((sk|pk)-[0-9a-zA-Z]{48})");
    patterns_.emplace_back(R"(api[_-]?key[_-]?[0-9a-f]{32,})", icase);
    patterns_.emplace_back(R"((mongodb|postgresql|postgres|mysql|redis)://[^@\s]+@[^/\s]+)",
                           icase);
    patterns_.emplace_back(R"(eyJ[A-Za-z0-9_=-]+\.[A-Za-z0-9_=-]+\.?[A-Za-z0-9_.+/=-]*)");
    patterns_.emplace_back(R"((password|passwd|pwd)\s*[=:]\s*\S+)", icase);
    patterns_.emplace_back(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})");
}

std::string RedactingSanitizer::sanitize(std::string_view text) const {
    std::string cleaned = common::sanitizeUtf8(text);
    for (auto& ch : cleaned) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
            ch = ' ';
        } else if (c == 0x7F) {
            ch = ' ';
        }
    }

    // std::regex recurses per character; bound its input well above the output cap.
    cleaned = common::truncateUtf8(collapseWhitespace(cleaned), kMaxLength * 2);

    const std::string replacement(kRedacted);
    for (const auto& re : patterns_) {
        cleaned = std::regex_replace(cleaned, re, replacement);
    }

    return common::truncateUtf8(collapseWhitespace(cleaned), kMaxLength);
}

std::unique_ptr<ITraceSpan> NoopTracer::startSpan(std::string_view) {
    return nullptr;
}

std::unique_ptr<ITraceSpan> LoggingTracer::startSpan(std::string_view operation) {
    return std::make_unique<LoggingSpan>(std::string(operation));
}

} // namespace beacon::retrieval
