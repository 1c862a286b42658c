#pragma once
#include <iosfwd>
#include <string>

// Process-wide diagnostic sink. Silent until a sink is installed.
namespace Log {
    enum class Level { Debug, Info, Warn, Error, Off };

    void set_sink(std::ostream* sink);
    void set_level(Level level);
    Level level();

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);
}
