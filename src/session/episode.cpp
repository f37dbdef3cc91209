#include "session/episode.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/step_codec.hpp"

namespace compgym::session {

using core::errors::ErrorCategory;
using core::errors::GymError;
using nlohmann::json;

StepIterator::value_type StepIterator::operator*() const {
    return episode_->get(index_);
}

StepIterator StepRange::begin() const {
    return StepIterator(episode_, 0);
}

StepIterator StepRange::end() const {
    return StepIterator(episode_, episode_->num_steps());
}

GymError Episode::index_error(const std::size_t index, const std::size_t size) {
    return GymError{ErrorCategory::Lookup,
                    "Step index " + std::to_string(index) + " out of range for " +
                        std::to_string(size) + " steps",
                    "index_out_of_range"};
}

core::errors::Result<double> Episode::total_reward() const {
    double total = 0.0;
    for (const auto& step : iter_steps()) {
        if (core::errors::is_error(step)) {
            return core::errors::get_error(step);
        }
        total += core::errors::get_value(step).reward;
    }
    return total;
}

core::errors::Status Episode::save(const std::filesystem::path& path) const {
    json steps = json::array();
    for (const auto& step : iter_steps()) {
        if (core::errors::is_error(step)) {
            return core::errors::get_error(step);
        }
        auto encodable = protocol::check_encodable(core::errors::get_value(step));
        if (core::errors::is_error(encodable)) {
            return encodable;
        }
        steps.push_back(protocol::step_to_json(core::errors::get_value(step)));
    }

    json document;
    document["steps"] = std::move(steps);
    std::string text;
    try {
        text = document.dump(2);
    } catch (const json::exception& e) {
        return GymError{ErrorCategory::Input,
                        std::string("Unable to encode episode: ") + e.what(),
                        "step_encode_failed",
                        "Text fields must be valid UTF-8."};
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return GymError{ErrorCategory::Storage,
                            "Unable to create directory: " + path.parent_path().string(),
                            "step_write_failed"};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return GymError{ErrorCategory::Storage,
                        "Unable to open episode file: " + path.string(),
                        "step_write_failed"};
    }

    out << text << "\n";
    if (!out.good()) {
        return GymError{ErrorCategory::Storage,
                        "Unable to write episode file: " + path.string(),
                        "step_write_failed"};
    }
    return core::errors::ok();
}

}  // namespace compgym::session
