#include "input/backend_mapping.hpp"

#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"
#include "input/backend_tables.hpp"

namespace compgym::input {

using protocol::KeyboardKey;
using protocol::MouseButton;

namespace {

constexpr KeyboardKey kDefaultKey = KeyboardKey::Enter;
constexpr MouseButton kDefaultButton = MouseButton::Left;

const std::string* find_key_native(const BackendMapping& mapping, const KeyboardKey key) {
    for (const auto& entry : mapping.keys) {
        if (entry.key == key) {
            return &entry.native;
        }
    }
    return nullptr;
}

const std::string* find_button_native(const BackendMapping& mapping,
                                      const MouseButton button) {
    for (const auto& entry : mapping.buttons) {
        if (entry.button == button) {
            return &entry.native;
        }
    }
    return nullptr;
}

}  // namespace

std::string key_to_backend(const BackendMapping& mapping, const KeyboardKey key) {
    if (protocol::is_character_key(key)) {
        return protocol::to_string(key);
    }
    if (const auto* native = find_key_native(mapping, key)) {
        return *native;
    }

    LOG_WARN("Mapping miss: backend '" + mapping.backend + "' has no entry for key '" +
             protocol::to_string(key) + "', using '" +
             protocol::to_string(kDefaultKey) + "'");
    if (const auto* fallback = find_key_native(mapping, kDefaultKey)) {
        return *fallback;
    }
    return protocol::to_string(kDefaultKey);
}

std::string button_to_backend(const BackendMapping& mapping, const MouseButton button) {
    if (const auto* native = find_button_native(mapping, button)) {
        return *native;
    }

    LOG_WARN("Mapping miss: backend '" + mapping.backend +
             "' has no entry for button '" + protocol::to_string(button) +
             "', using '" + protocol::to_string(kDefaultButton) + "'");
    if (const auto* fallback = find_button_native(mapping, kDefaultButton)) {
        return *fallback;
    }
    return protocol::to_string(kDefaultButton);
}

std::optional<KeyboardKey> key_from_backend(const BackendMapping& mapping,
                                            const std::string& native) {
    std::optional<KeyboardKey> match;
    int match_count = 0;
    for (const auto& entry : mapping.keys) {
        if (entry.native == native) {
            match = entry.key;
            ++match_count;
        }
    }
    if (match_count == 1) {
        return match;
    }
    if (match_count > 1) {
        LOG_DEBUG("Backend '" + mapping.backend + "' key '" + native +
                  "' is shared by several canonical keys");
        return std::nullopt;
    }

    for (const auto& alias : mapping.key_aliases) {
        if (alias.native == native) {
            return alias.key;
        }
    }

    if (native.size() == 1 &&
        std::isalnum(static_cast<unsigned char>(native[0])) != 0) {
        const auto key = protocol::key_from_string(native);
        if (key.has_value() && protocol::is_character_key(key.value())) {
            return key;
        }
    }
    return std::nullopt;
}

std::optional<MouseButton> button_from_backend(const BackendMapping& mapping,
                                               const std::string& native) {
    std::optional<MouseButton> match;
    int match_count = 0;
    for (const auto& entry : mapping.buttons) {
        if (entry.native == native) {
            match = entry.button;
            ++match_count;
        }
    }
    if (match_count == 1) {
        return match;
    }
    return std::nullopt;
}

MappingRegistry MappingRegistry::with_builtin_backends() {
    MappingRegistry registry;
    registry.register_backend(pynput_mapping());
    registry.register_backend(pyautogui_mapping());
    registry.register_backend(vnc_mapping());
    registry.register_backend(e2b_mapping());
    registry.register_backend(scrapybara_mapping());
    registry.register_backend(pigdev_mapping());
    registry.register_backend(daemon_mapping());
    return registry;
}

void MappingRegistry::register_backend(BackendMapping mapping) {
    const std::string name = mapping.backend;
    if (mappings_.find(name) != mappings_.end()) {
        LOG_INFO("MappingRegistry: replacing table for backend '" + name + "'");
    }
    mappings_[name] = std::move(mapping);
}

const BackendMapping* MappingRegistry::find(const std::string& backend) const {
    auto it = mappings_.find(backend);
    if (it == mappings_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool MappingRegistry::contains(const std::string& backend) const {
    return mappings_.find(backend) != mappings_.end();
}

std::vector<std::string> MappingRegistry::backend_names() const {
    std::vector<std::string> names;
    names.reserve(mappings_.size());
    for (const auto& entry : mappings_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string MappingRegistry::to_backend(const std::string& backend,
                                        const KeyboardKey key) const {
    if (const auto* mapping = find(backend)) {
        return key_to_backend(*mapping, key);
    }
    LOG_WARN("Mapping miss: no table registered for backend '" + backend + "'");
    return protocol::to_string(key);
}

std::string MappingRegistry::to_backend(const std::string& backend,
                                        const MouseButton button) const {
    if (const auto* mapping = find(backend)) {
        return button_to_backend(*mapping, button);
    }
    LOG_WARN("Mapping miss: no table registered for backend '" + backend + "'");
    return protocol::to_string(button);
}

std::optional<KeyboardKey> MappingRegistry::key_from_backend(
    const std::string& backend, const std::string& native) const {
    if (const auto* mapping = find(backend)) {
        return input::key_from_backend(*mapping, native);
    }
    return std::nullopt;
}

std::optional<MouseButton> MappingRegistry::button_from_backend(
    const std::string& backend, const std::string& native) const {
    if (const auto* mapping = find(backend)) {
        return input::button_from_backend(*mapping, native);
    }
    return std::nullopt;
}

}  // namespace compgym::input
