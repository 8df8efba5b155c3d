#pragma once

#include "window/window_builder.hpp"
#include "window/window_class.hpp"
#include "window/window_dispatch.hpp"
#include "window/window_proc.hpp"

#include <Windows.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hb_tests
{
    inline constexpr UINT k_ping_message = WM_APP + 7;
    inline constexpr UINT k_destroy_self_message = WM_APP + 8;

    // Everything a `RecordingWindowProc` observed. Outlives the proc.
    struct EventLog final
    {
        std::vector<UINT> events;
        int destructions{ 0 };
        std::size_t events_at_destruction{ 0 };

        [[nodiscard]] std::size_t count(const UINT msg) const
        {
            return static_cast<std::size_t>(std::count(events.begin(), events.end(), msg));
        }

        [[nodiscard]] std::ptrdiff_t index_of(const UINT msg) const
        {
            const auto it = std::find(events.begin(), events.end(), msg);
            return it == events.end() ? -1 : it - events.begin();
        }
    };

    // Logs every message; handles only the teardown message (returns 0).
    class RecordingWindowProc : public hb::window::IWindowProc
    {
    public:
        explicit RecordingWindowProc(EventLog& log) noexcept :
            _log(log)
        {
        }

        ~RecordingWindowProc() override
        {
            ++_log.destructions;
            _log.events_at_destruction = _log.events.size();
        }

        std::optional<LRESULT> handle_event(const HWND hwnd, const UINT msg, const WPARAM wparam, const LPARAM lparam) override
        {
            _log.events.push_back(msg);
            return on_event(hwnd, msg, wparam, lparam);
        }

    protected:
        virtual std::optional<LRESULT> on_event(HWND /*hwnd*/, const UINT msg, WPARAM /*wparam*/, LPARAM /*lparam*/)
        {
            if (msg == hb::window::k_teardown_event)
            {
                return 0;
            }
            return std::nullopt;
        }

        [[nodiscard]] EventLog& log() const noexcept
        {
            return _log;
        }

    private:
        EventLog& _log;
    };

    [[nodiscard]] inline std::wstring unique_class_name(const std::wstring_view tag)
    {
        static unsigned sequence = 0;
        std::wstring name(L"hb_tests_");
        name.append(tag);
        name.push_back(L'_');
        name.append(std::to_wstring(::GetCurrentProcessId()));
        name.push_back(L'_');
        name.append(std::to_wstring(++sequence));
        return name;
    }

    // Registers a class routed through `dispatch_window_event` for one test.
    class ScopedWindowClass final
    {
    public:
        explicit ScopedWindowClass(const std::wstring_view tag)
        {
            hb::window::WindowClassConfig config{};
            config.class_name = unique_class_name(tag);
            auto registered = hb::window::register_window_class(config);
            if (registered)
            {
                _class.emplace(std::move(registered.value()));
            }
        }

        ~ScopedWindowClass()
        {
            if (_class)
            {
                (void)hb::window::unregister_window_class(*_class);
            }
        }

        ScopedWindowClass(const ScopedWindowClass&) = delete;
        ScopedWindowClass& operator=(const ScopedWindowClass&) = delete;

        [[nodiscard]] bool valid() const noexcept
        {
            return _class.has_value();
        }

        [[nodiscard]] const hb::window::WindowClass& get() const noexcept
        {
            return *_class;
        }

    private:
        std::optional<hb::window::WindowClass> _class;
    };

    // Message-only windows: no painting, activation or shell traffic.
    [[nodiscard]] inline hb::window::WindowConfig message_only_config()
    {
        hb::window::WindowConfig config{};
        config.parent = HWND_MESSAGE;
        return config;
    }
}
