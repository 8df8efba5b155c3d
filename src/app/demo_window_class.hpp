#pragma once

#include "window/window_class.hpp"
#include "window/window_error.hpp"

#include <expected>
#include <string>

namespace hb::logging
{
    class Logger;
}

namespace hb::app
{
    // Registers the demo's class: application icon, arrow cursor, white
    // background. Once registered the class owns the background brush; on
    // failure the brush is deleted here.
    [[nodiscard]] std::expected<window::WindowClass, window::WindowError> register_demo_window_class(
        const std::wstring& class_name,
        logging::Logger& logger) noexcept;
}
