#pragma once

namespace hb::app
{
    // Demo executable: config -> logging -> class registration -> one window
    // -> message loop. Returns the process exit code.
    class Application final
    {
    public:
        [[nodiscard]] int run();
    };
}
