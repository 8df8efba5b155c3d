#include "app/application.hpp"

#include "core/console_writer.hpp"

#include <Windows.h>

#include <cwchar>
#include <exception>

int WINAPI wWinMain(HINSTANCE /*instance*/, HINSTANCE /*prev_instance*/, PWSTR /*command_line*/, int /*show_command*/)
{
    try
    {
        hb::app::Application application;
        return application.run();
    }
    catch (const std::exception& error)
    {
        wchar_t message[512]{};
        _snwprintf_s(message, _TRUNCATE, L"Unhandled exception: %hs", error.what());
        hb::core::report_failure_line(message);
        return static_cast<int>(ERROR_UNHANDLED_EXCEPTION);
    }
}
