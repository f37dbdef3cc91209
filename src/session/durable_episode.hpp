#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "protocol/step_codec.hpp"
#include "session/episode.hpp"

namespace compgym::session {

// Episode persisted as one file per step: step_1<ext> .. step_N<ext>.
// Numbering is kept contiguous; insert and remove rewrite every file from
// the affected index to the end and delete the stale trailing file.
class DurableEpisode : public Episode {
public:
    // Fails with episode_exists if `directory` already holds step files.
    static core::errors::Result<std::unique_ptr<DurableEpisode>> create(
        const std::filesystem::path& directory, protocol::StepEncoding encoding);

    // Reloads an episode written earlier. Gaps in numbering and undecodable
    // files are episode_corrupt.
    static core::errors::Result<std::unique_ptr<DurableEpisode>> open(
        const std::filesystem::path& directory, protocol::StepEncoding encoding);

    std::size_t num_steps() const override { return steps_.size(); }
    core::errors::Result<protocol::Step> get(std::size_t index) const override;
    core::errors::Status set(std::size_t index, const protocol::Step& step) override;

    core::errors::Status push(const protocol::Step& step) override;
    core::errors::Status insert(const protocol::Step& step, std::size_t index) override;
    core::errors::Result<protocol::Step> pop() override;
    core::errors::Status remove(std::size_t index) override;
    // Deletes only files matching the step naming convention.
    core::errors::Status clear() override;

    const std::filesystem::path& directory() const { return directory_; }
    protocol::StepEncoding encoding() const { return encoding_; }

    // 1-based, e.g. step_3.json.
    std::filesystem::path step_path(std::size_t position) const;

private:
    DurableEpisode(std::filesystem::path directory, protocol::StepEncoding encoding);

    std::optional<std::size_t> step_number(const std::filesystem::path& file) const;
    core::errors::Result<std::vector<std::size_t>> existing_step_numbers() const;
    core::errors::Result<protocol::Step> read_step(std::size_t position) const;
    core::errors::Status write_step(std::size_t position, const protocol::Step& step) const;
    // Writes steps_[from..] to their files and deletes the file one past the end.
    core::errors::Status write_range(std::size_t from) const;

    std::filesystem::path directory_;
    protocol::StepEncoding encoding_;
    std::vector<protocol::Step> steps_;
};

}  // namespace compgym::session
