#include <beacon/config/config_helpers.h>
#include <beacon/config/retrieval_config.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace beacon::config {

namespace {

constexpr std::array<const char*, 18> kKnownKeys = {
    "cache_enabled",
    "cache_ttl_seconds",
    "cache_max_entries",
    "cache_entry_bytes",
    "partitioned_invalidation",
    "cache_sweep_interval_seconds",
    "adapter_timeout_ms",
    "worker_threads",
    "clamp_scores",
    "slo_p95_latency_ms",
    "slo_max_adapter_failure_rate_percent",
    "slo_min_cache_hit_rate_percent",
    "slo_min_cache_samples",
    "latency_window",
    "log_level",
    "document_index",
    "pattern_table",
    "playbook_table",
};

template <typename T> std::optional<T> parseNumber(const std::string& raw) {
    T value{};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBool(std::string raw) {
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "1" || raw == "yes" || raw == "on") {
        return true;
    }
    if (raw == "false" || raw == "0" || raw == "no" || raw == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename T, typename Apply>
void setNumber(const std::string& key, const std::string& raw, Apply&& apply) {
    if (auto v = parseNumber<T>(raw)) {
        apply(*v);
    } else {
        spdlog::warn("Ignoring invalid value '{}' for retrieval.{}", raw, key);
    }
}

void setFlag(const std::string& key, const std::string& raw, bool& target) {
    if (auto v = parseBool(raw)) {
        target = *v;
    } else {
        spdlog::warn("Ignoring invalid boolean '{}' for retrieval.{}", raw, key);
    }
}

} // namespace

void applyConfigValues(RetrievalConfig& cfg, const std::map<std::string, std::string>& values) {
    for (const auto& [key, raw] : values) {
        if (key == "cache_enabled") {
            setFlag(key, raw, cfg.cacheEnabled);
        } else if (key == "cache_ttl_seconds") {
            setNumber<int64_t>(key, raw, [&](int64_t v) {
                if (v > 0)
                    cfg.cacheTtl = std::chrono::seconds(v);
                else
                    spdlog::warn("retrieval.cache_ttl_seconds must be positive, got {}", v);
            });
        } else if (key == "cache_max_entries") {
            setNumber<size_t>(key, raw, [&](size_t v) { cfg.cacheMaxEntries = v; });
        } else if (key == "cache_entry_bytes") {
            setNumber<size_t>(key, raw, [&](size_t v) { cfg.cacheEntryBytes = v; });
        } else if (key == "partitioned_invalidation") {
            setFlag(key, raw, cfg.partitionedInvalidation);
        } else if (key == "cache_sweep_interval_seconds") {
            setNumber<int64_t>(key, raw, [&](int64_t v) {
                cfg.cacheSweepInterval = std::chrono::seconds(std::max<int64_t>(v, 0));
            });
        } else if (key == "adapter_timeout_ms") {
            setNumber<int64_t>(key, raw, [&](int64_t v) {
                if (v > 0)
                    cfg.adapterTimeout = std::chrono::milliseconds(v);
                else
                    spdlog::warn("retrieval.adapter_timeout_ms must be positive, got {}", v);
            });
        } else if (key == "worker_threads") {
            setNumber<size_t>(key, raw, [&](size_t v) { cfg.workerThreads = std::max<size_t>(v, 1); });
        } else if (key == "clamp_scores") {
            setFlag(key, raw, cfg.clampScores);
        } else if (key == "slo_p95_latency_ms") {
            setNumber<double>(key, raw, [&](double v) { cfg.slo.p95LatencyMs = v; });
        } else if (key == "slo_max_adapter_failure_rate_percent") {
            setNumber<double>(key, raw, [&](double v) { cfg.slo.maxAdapterFailureRatePercent = v; });
        } else if (key == "slo_min_cache_hit_rate_percent") {
            setNumber<double>(key, raw, [&](double v) { cfg.slo.minCacheHitRatePercent = v; });
        } else if (key == "slo_min_cache_samples") {
            setNumber<uint64_t>(key, raw, [&](uint64_t v) { cfg.slo.minCacheSamples = v; });
        } else if (key == "latency_window") {
            setNumber<size_t>(key, raw, [&](size_t v) { cfg.latencyWindow = std::max<size_t>(v, 1); });
        } else if (key == "log_level") {
            cfg.logLevel = raw;
        } else if (key == "document_index") {
            cfg.documentIndexPath = expand_tilde(raw).string();
        } else if (key == "pattern_table") {
            cfg.patternTablePath = expand_tilde(raw).string();
        } else if (key == "playbook_table") {
            cfg.playbookTablePath = expand_tilde(raw).string();
        } else {
            spdlog::debug("Unknown retrieval config key '{}'", key);
        }
    }
}

std::map<std::string, std::string> environmentOverrides() {
    std::map<std::string, std::string> values;
    for (const char* key : kKnownKeys) {
        std::string envName = "BEACON_";
        for (const char* p = key; *p; ++p) {
            envName.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
        }
        if (const char* v = std::getenv(envName.c_str()); v && *v) {
            values[key] = v;
        }
    }
    return values;
}

Result<RetrievalConfig> loadRetrievalConfig(const std::filesystem::path& configPath) {
    RetrievalConfig cfg;

    std::filesystem::path path = configPath.empty() ? get_config_path() : configPath;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto values = parse_config_section(path, "retrieval");
        spdlog::debug("Loaded {} retrieval settings from {}", values.size(), path.string());
        applyConfigValues(cfg, values);
    } else if (!configPath.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + configPath.string()};
    }

    applyConfigValues(cfg, environmentOverrides());
    return cfg;
}

} // namespace beacon::config
