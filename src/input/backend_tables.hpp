#pragma once

#include "input/backend_mapping.hpp"

namespace compgym::input {

BackendMapping pynput_mapping();
BackendMapping pyautogui_mapping();
BackendMapping vnc_mapping();
BackendMapping e2b_mapping();
BackendMapping scrapybara_mapping();
BackendMapping pigdev_mapping();

// The remote daemon speaks the canonical wire vocabulary directly.
BackendMapping daemon_mapping();

}  // namespace compgym::input
