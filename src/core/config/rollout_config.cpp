#include "core/config/rollout_config.hpp"
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace compgym::core::config {

    using namespace compgym::core::errors;
    using nlohmann::json;

    // Values as they appear in the document, before validation.
    struct RawRolloutConfig {
        std::optional<std::string> backend;
        std::optional<std::string> episode_dir;
        std::optional<std::string> encoding;
        std::optional<std::string> storage;
        std::optional<std::int64_t> max_steps;
        std::optional<std::string> cache_dir;
        std::optional<std::string> log_level;
        std::optional<std::int64_t> preview_interval_ms;
    };

    namespace {

        GymError type_error(const std::string& key, const std::string& expected) {
            return GymError{ErrorCategory::Input,
                            "Config key '" + key + "' must be " + expected + ".",
                            "invalid_config_value"};
        }

        std::optional<GymError> read_string(const json& value, const std::string& key,
                                            std::optional<std::string>& out) {
            if (!value.is_string()) {
                return type_error(key, "a string");
            }
            out = value.get<std::string>();
            return std::nullopt;
        }

        std::optional<GymError> read_integer(const json& value, const std::string& key,
                                             std::optional<std::int64_t>& out) {
            if (!value.is_number_integer()) {
                return type_error(key, "an integer");
            }
            out = value.get<std::int64_t>();
            return std::nullopt;
        }

    } // namespace

    std::string to_string(const EpisodeStorage storage) {
        switch (storage) {
            case EpisodeStorage::Memory:  return "memory";
            case EpisodeStorage::Durable: return "durable";
            default: return "unknown";
        }
    }

    Result<RolloutConfig> parse_rollout_config(const std::string& text,
                                               const input::MappingRegistry& registry) {
        json document;
        try {
            document = json::parse(text);
        } catch (const json::parse_error& e) {
            return GymError{ErrorCategory::Input, std::string("Config is not valid JSON: ") + e.what(),
                            "invalid_config_json"};
        }
        if (!document.is_object()) {
            return GymError{ErrorCategory::Input, "Config must be a JSON object.", "invalid_config_json"};
        }

        // 1. Parser phase: pick up raw values, reject unknown keys
        RawRolloutConfig raw;
        for (auto it = document.begin(); it != document.end(); ++it) {
            const std::string& key = it.key();
            std::optional<GymError> error;
            if (key == "backend") error = read_string(it.value(), key, raw.backend);
            else if (key == "episode_dir") error = read_string(it.value(), key, raw.episode_dir);
            else if (key == "encoding") error = read_string(it.value(), key, raw.encoding);
            else if (key == "storage") error = read_string(it.value(), key, raw.storage);
            else if (key == "max_steps") error = read_integer(it.value(), key, raw.max_steps);
            else if (key == "cache_dir") error = read_string(it.value(), key, raw.cache_dir);
            else if (key == "log_level") error = read_string(it.value(), key, raw.log_level);
            else if (key == "preview_interval_ms") error = read_integer(it.value(), key, raw.preview_interval_ms);
            else {
                return GymError{ErrorCategory::Input, "Unknown config key: " + key, "unknown_config_key"};
            }
            if (error.has_value()) {
                return error.value();
            }
        }

        // 2. Validator phase
        RolloutConfig config;

        if (raw.backend) {
            if (!registry.contains(raw.backend.value())) {
                return GymError{ErrorCategory::Input, "Unknown backend: " + raw.backend.value(),
                                "unknown_backend", "Register a mapping table for it first."};
            }
            config.backend = raw.backend.value();
        }

        if (raw.episode_dir) {
            if (raw.episode_dir->empty()) {
                return GymError{ErrorCategory::Input, "episode_dir cannot be empty.", "invalid_path"};
            }
            config.episode_dir = raw.episode_dir.value();
        }

        if (raw.encoding) {
            if (raw.encoding.value() == "json") config.encoding = protocol::StepEncoding::Json;
            else if (raw.encoding.value() == "msgpack") config.encoding = protocol::StepEncoding::MessagePack;
            else {
                return GymError{ErrorCategory::Input, "Unknown encoding: " + raw.encoding.value(),
                                "invalid_config_value", "Use \"json\" or \"msgpack\"."};
            }
        }

        if (raw.storage) {
            if (raw.storage.value() == "memory") config.storage = EpisodeStorage::Memory;
            else if (raw.storage.value() == "durable") config.storage = EpisodeStorage::Durable;
            else {
                return GymError{ErrorCategory::Input, "Unknown storage: " + raw.storage.value(),
                                "invalid_config_value", "Use \"memory\" or \"durable\"."};
            }
        }

        if (raw.max_steps) {
            if (raw.max_steps.value() < 1 || raw.max_steps.value() > 100000) {
                return GymError{ErrorCategory::Input, "max_steps out of bounds", "bounds_error",
                                "Must be between 1 and 100000."};
            }
            config.max_steps = static_cast<std::uint32_t>(raw.max_steps.value());
        }

        if (raw.cache_dir) config.cache_dir = raw.cache_dir.value();

        if (raw.log_level) {
            if (!logging::Logger::parse_level(raw.log_level.value(), config.log_level)) {
                return GymError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(),
                                "invalid_config_value", "Use debug, info, warn or error."};
            }
        }

        if (raw.preview_interval_ms) {
            if (raw.preview_interval_ms.value() < 0 || raw.preview_interval_ms.value() > 60000) {
                return GymError{ErrorCategory::Input, "preview_interval_ms out of bounds", "bounds_error",
                                "Must be between 0 and 60000."};
            }
            config.preview_interval_ms = static_cast<std::uint32_t>(raw.preview_interval_ms.value());
        }

        return config;
    }

    Result<RolloutConfig> load_rollout_config(const std::filesystem::path& path,
                                              const input::MappingRegistry& registry) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return GymError{ErrorCategory::Input, "Unable to open config file: " + path.string(),
                            "config_open_failed"};
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return parse_rollout_config(buffer.str(), registry);
    }

    void apply_logging(const RolloutConfig& config) {
        logging::Logger::get().set_min_level(config.log_level);
    }

} // namespace compgym::core::config
