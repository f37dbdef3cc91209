#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/gym_errors.hpp"
#include "core/logging/logger.hpp"
#include "input/backend_mapping.hpp"
#include "protocol/step_codec.hpp"

namespace compgym::core::config {

    enum class EpisodeStorage {
        Memory,
        Durable
    };

    std::string to_string(EpisodeStorage storage);

    struct RolloutConfig {
        std::string backend = "daemon";
        std::filesystem::path episode_dir = "episodes";
        protocol::StepEncoding encoding = protocol::StepEncoding::Json;
        EpisodeStorage storage = EpisodeStorage::Memory;
        std::uint32_t max_steps = 100;
        // Empty means a private temporary directory.
        std::filesystem::path cache_dir;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        // 0 disables the preview poller.
        std::uint32_t preview_interval_ms = 0;
    };

    // Parses a JSON object. Missing keys keep their defaults; unknown keys and
    // backends not present in `registry` are rejected.
    errors::Result<RolloutConfig> parse_rollout_config(const std::string& text,
                                               const input::MappingRegistry& registry);
    errors::Result<RolloutConfig> load_rollout_config(const std::filesystem::path& path,
                                              const input::MappingRegistry& registry);

    void apply_logging(const RolloutConfig& config);

} // namespace compgym::core::config
