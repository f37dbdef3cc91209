#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace compgym::core::config {

    // Monotonic id source owned by the component that needs fresh ids.
    class IdCounter {
    public:
        IdCounter() = default;

        // Starts after the largest purely numeric id in `existing`; other ids
        // are ignored.
        explicit IdCounter(const std::vector<std::string>& existing) {
            for (const auto& id : existing) {
                if (!is_numeric(id)) {
                    continue;
                }
                const std::uint64_t value = std::stoull(id);
                if (value + 1 > next_) {
                    next_ = value + 1;
                }
            }
        }

        std::string next() {
            return std::to_string(next_++);
        }

        std::uint64_t peek() const {
            return next_;
        }

    private:
        static bool is_numeric(const std::string& id) {
            if (id.empty() || id.size() > 18) {
                return false;
            }
            for (const unsigned char c : id) {
                if (std::isdigit(c) == 0) {
                    return false;
                }
            }
            return true;
        }

        std::uint64_t next_ = 0;
    };

} // namespace compgym::core::config
