#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol/input_vocabulary.hpp"

namespace compgym::input {

struct KeyEntry {
    protocol::KeyboardKey key;
    std::string native;
};

struct ButtonEntry {
    protocol::MouseButton button;
    std::string native;
};

// Native values accepted on the way back only, e.g. pynput "shift_l".
struct KeyAlias {
    std::string native;
    protocol::KeyboardKey key;
};

// Static translation table for one backend. Only non-character keys are
// listed; letters and digits map by their lower-cased literal value.
struct BackendMapping {
    std::string backend;
    std::vector<KeyEntry> keys;
    std::vector<KeyAlias> key_aliases;
    std::vector<ButtonEntry> buttons;
};

// Total. A key missing from the table resolves to the table's native value
// for Enter and logs a warning.
std::string key_to_backend(const BackendMapping& mapping, protocol::KeyboardKey key);

// Total. A missing button resolves to the native value for Left.
std::string button_to_backend(const BackendMapping& mapping,
                              protocol::MouseButton button);

// Partial. Returns nullopt when the native value has no canonical
// counterpart or is shared by more than one canonical key.
std::optional<protocol::KeyboardKey> key_from_backend(const BackendMapping& mapping,
                                                      const std::string& native);
std::optional<protocol::MouseButton> button_from_backend(const BackendMapping& mapping,
                                                         const std::string& native);

// Backend tables keyed by backend name. Adding a backend means registering
// one table; call sites only ever name the backend.
class MappingRegistry {
public:
    static MappingRegistry with_builtin_backends();

    // Replaces an existing table with the same backend name.
    void register_backend(BackendMapping mapping);

    const BackendMapping* find(const std::string& backend) const;
    bool contains(const std::string& backend) const;
    std::vector<std::string> backend_names() const;

    // Unknown backends fall back to the canonical wire string.
    std::string to_backend(const std::string& backend, protocol::KeyboardKey key) const;
    std::string to_backend(const std::string& backend, protocol::MouseButton button) const;

    std::optional<protocol::KeyboardKey> key_from_backend(const std::string& backend,
                                                          const std::string& native) const;
    std::optional<protocol::MouseButton> button_from_backend(
        const std::string& backend, const std::string& native) const;

private:
    std::map<std::string, BackendMapping> mappings_;
};

}  // namespace compgym::input
