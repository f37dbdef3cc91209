#include "session/episode_factory.hpp"

#include <utility>
#include "session/durable_episode.hpp"
#include "session/in_memory_episode.hpp"

namespace compgym::session {

EpisodeFactory make_episode_factory(const core::config::RolloutConfig& config) {
    if (config.storage == core::config::EpisodeStorage::Memory) {
        return [](const std::string&) -> core::errors::Result<std::unique_ptr<Episode>> {
            return std::unique_ptr<Episode>(std::make_unique<InMemoryEpisode>());
        };
    }

    const auto root = config.episode_dir;
    const auto encoding = config.encoding;
    return [root, encoding](
               const std::string& episode_id) -> core::errors::Result<std::unique_ptr<Episode>> {
        auto created = DurableEpisode::create(root / episode_id, encoding);
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        return std::unique_ptr<Episode>(std::move(core::errors::get_value(created)));
    };
}

}  // namespace compgym::session
