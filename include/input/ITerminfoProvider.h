#pragma once

#include <string>
#include <unordered_map>

namespace VTInput::Input {

/**
 * @brief Abstract source of terminfo string capabilities
 *
 * Loading and parsing the terminfo database is left to the implementer;
 * the sequence table only reads the key capabilities ("kcuu1", "kf5",
 * "kUP5", ...) and the byte strings the terminal sends for them.
 */
class ITerminfoProvider {
public:
    virtual ~ITerminfoProvider() = default;

    // Capability name -> escape sequence for the given terminal type.
    // Returns an empty map when the terminal type is unknown.
    virtual std::unordered_map<std::string, std::string> GetStringCapabilities(
        const std::string& term) const = 0;
};

} // namespace VTInput::Input
