#include "session/durable_episode.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace compgym::session {

using core::errors::ErrorCategory;
using core::errors::GymError;

namespace {

constexpr const char* kStepPrefix = "step_";

}  // namespace

DurableEpisode::DurableEpisode(std::filesystem::path directory,
                               const protocol::StepEncoding encoding)
    : directory_(std::move(directory)), encoding_(encoding) {}

core::errors::Result<std::unique_ptr<DurableEpisode>> DurableEpisode::create(
    const std::filesystem::path& directory, const protocol::StepEncoding encoding) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec || !std::filesystem::is_directory(directory, ec)) {
        return GymError{ErrorCategory::Storage,
                        "Unable to create episode directory: " + directory.string(),
                        "step_write_failed"};
    }

    std::unique_ptr<DurableEpisode> episode(new DurableEpisode(directory, encoding));
    auto existing = episode->existing_step_numbers();
    if (core::errors::is_error(existing)) {
        return core::errors::get_error(existing);
    }
    if (!core::errors::get_value(existing).empty()) {
        return GymError{ErrorCategory::Storage,
                        "Directory already holds an episode: " + directory.string(),
                        "episode_exists",
                        "Use DurableEpisode::open to continue it."};
    }
    return std::move(episode);
}

core::errors::Result<std::unique_ptr<DurableEpisode>> DurableEpisode::open(
    const std::filesystem::path& directory, const protocol::StepEncoding encoding) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec) || ec) {
        return GymError{ErrorCategory::Lookup,
                        "Episode directory not found: " + directory.string(),
                        "not_found"};
    }

    std::unique_ptr<DurableEpisode> episode(new DurableEpisode(directory, encoding));
    auto existing = episode->existing_step_numbers();
    if (core::errors::is_error(existing)) {
        return core::errors::get_error(existing);
    }
    auto numbers = core::errors::get_value(existing);
    std::sort(numbers.begin(), numbers.end());
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (numbers[i] != i + 1) {
            return GymError{ErrorCategory::Storage,
                            "Step files in " + directory.string() +
                                " are not numbered 1.." +
                                std::to_string(numbers.size()),
                            "episode_corrupt"};
        }
    }

    for (std::size_t position = 1; position <= numbers.size(); ++position) {
        auto step = episode->read_step(position);
        if (core::errors::is_error(step)) {
            return GymError{ErrorCategory::Storage,
                            "Unreadable step " + std::to_string(position) + ": " +
                                core::errors::get_error(step).message,
                            "episode_corrupt"};
        }
        episode->steps_.push_back(std::move(core::errors::get_value(step)));
    }

    LOG_INFO("DurableEpisode: loaded " + std::to_string(episode->steps_.size()) +
             " steps from " + directory.string());
    return std::move(episode);
}

std::filesystem::path DurableEpisode::step_path(const std::size_t position) const {
    return directory_ /
           (kStepPrefix + std::to_string(position) + protocol::file_extension(encoding_));
}

std::optional<std::size_t> DurableEpisode::step_number(
    const std::filesystem::path& file) const {
    const std::string name = file.filename().string();
    const std::string prefix = kStepPrefix;
    const std::string extension = protocol::file_extension(encoding_);
    if (name.size() <= prefix.size() + extension.size() ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - extension.size(), extension.size(), extension) != 0) {
        return std::nullopt;
    }

    const std::string digits =
        name.substr(prefix.size(), name.size() - prefix.size() - extension.size());
    // Only the canonical spelling counts: step_01 is not step_1.
    if (digits.size() > 18 || (digits.size() > 1 && digits[0] == '0') ||
        !std::all_of(digits.begin(), digits.end(),
                     [](const unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoull(digits));
}

core::errors::Result<std::vector<std::size_t>> DurableEpisode::existing_step_numbers()
    const {
    std::vector<std::size_t> numbers;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return GymError{ErrorCategory::Storage,
                        "Unable to list episode directory: " + directory_.string(),
                        "step_read_failed"};
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (const auto number = step_number(entry.path())) {
            numbers.push_back(*number);
        }
    }
    return numbers;
}

core::errors::Result<protocol::Step> DurableEpisode::read_step(
    const std::size_t position) const {
    const auto path = step_path(position);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return GymError{ErrorCategory::Storage, "Unable to open step file: " + path.string(),
                        "step_read_failed"};
    }
    const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                          std::istreambuf_iterator<char>());
    return protocol::decode_step(bytes, encoding_);
}

core::errors::Status DurableEpisode::write_step(const std::size_t position,
                                                const protocol::Step& step) const {
    const auto path = step_path(position);
    auto temp_path = path;
    temp_path += ".tmp";

    auto encoded = protocol::encode_step(step, encoding_);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    const auto& bytes = core::errors::get_value(encoded);
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return GymError{ErrorCategory::Storage,
                            "Unable to open step file: " + temp_path.string(),
                            "step_write_failed"};
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out.good()) {
            return GymError{ErrorCategory::Storage,
                            "Unable to write step file: " + temp_path.string(),
                            "step_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return GymError{ErrorCategory::Storage,
                        "Unable to replace step file: " + path.string(),
                        "step_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Status DurableEpisode::write_range(const std::size_t from) const {
    for (std::size_t i = from; i < steps_.size(); ++i) {
        auto written = write_step(i + 1, steps_[i]);
        if (core::errors::is_error(written)) {
            return written;
        }
    }

    std::error_code ec;
    std::filesystem::remove(step_path(steps_.size() + 1), ec);
    if (ec) {
        return GymError{ErrorCategory::Storage,
                        "Unable to delete stale step file: " +
                            step_path(steps_.size() + 1).string(),
                        "step_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<protocol::Step> DurableEpisode::get(const std::size_t index) const {
    if (index >= steps_.size()) {
        return index_error(index, steps_.size());
    }
    return read_step(index + 1);
}

core::errors::Status DurableEpisode::set(const std::size_t index,
                                         const protocol::Step& step) {
    if (index >= steps_.size()) {
        return index_error(index, steps_.size());
    }
    auto written = write_step(index + 1, step);
    if (core::errors::is_error(written)) {
        return written;
    }
    steps_[index] = step;
    return core::errors::ok();
}

core::errors::Status DurableEpisode::push(const protocol::Step& step) {
    return insert(step, steps_.size());
}

core::errors::Status DurableEpisode::insert(const protocol::Step& step,
                                            const std::size_t index) {
    if (index > steps_.size()) {
        return index_error(index, steps_.size());
    }
    // Reject unencodable steps before any file is renumbered.
    auto encoded = protocol::encode_step(step, encoding_);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }

    steps_.insert(std::next(steps_.begin(), static_cast<std::ptrdiff_t>(index)), step);
    auto written = write_range(index);
    if (core::errors::is_error(written)) {
        steps_.erase(std::next(steps_.begin(), static_cast<std::ptrdiff_t>(index)));
        auto restored = write_range(index);
        if (core::errors::is_error(restored)) {
            LOG_ERROR("DurableEpisode: unable to restore " + directory_.string() +
                      " after failed insert: " +
                      core::errors::get_error(restored).message);
        }
        return written;
    }

    if (index + 1 < steps_.size()) {
        LOG_DEBUG("DurableEpisode: renumbered steps " + std::to_string(index + 2) + ".." +
                  std::to_string(steps_.size()) + " in " + directory_.string());
    }
    return core::errors::ok();
}

core::errors::Result<protocol::Step> DurableEpisode::pop() {
    if (steps_.empty()) {
        return index_error(0, 0);
    }

    std::error_code ec;
    std::filesystem::remove(step_path(steps_.size()), ec);
    if (ec) {
        return GymError{ErrorCategory::Storage,
                        "Unable to delete step file: " + step_path(steps_.size()).string(),
                        "step_write_failed"};
    }
    protocol::Step last = std::move(steps_.back());
    steps_.pop_back();
    return last;
}

core::errors::Status DurableEpisode::remove(const std::size_t index) {
    if (index >= steps_.size()) {
        return index_error(index, steps_.size());
    }

    protocol::Step removed = steps_[index];
    steps_.erase(std::next(steps_.begin(), static_cast<std::ptrdiff_t>(index)));
    auto written = write_range(index);
    if (core::errors::is_error(written)) {
        steps_.insert(std::next(steps_.begin(), static_cast<std::ptrdiff_t>(index)),
                      std::move(removed));
        auto restored = write_range(index);
        if (core::errors::is_error(restored)) {
            LOG_ERROR("DurableEpisode: unable to restore " + directory_.string() +
                      " after failed remove: " +
                      core::errors::get_error(restored).message);
        }
        return written;
    }

    LOG_DEBUG("DurableEpisode: removed step " + std::to_string(index + 1) + " from " +
              directory_.string());
    return core::errors::ok();
}

core::errors::Status DurableEpisode::clear() {
    auto existing = existing_step_numbers();
    if (core::errors::is_error(existing)) {
        return core::errors::get_error(existing);
    }

    for (const auto number : core::errors::get_value(existing)) {
        std::error_code ec;
        std::filesystem::remove(step_path(number), ec);
        if (ec) {
            return GymError{ErrorCategory::Storage,
                            "Unable to delete step file: " + step_path(number).string(),
                            "step_write_failed"};
        }
    }
    steps_.clear();
    return core::errors::ok();
}

}  // namespace compgym::session
