#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include "input/Driver.h"
#include "input/SequenceTable.h"

namespace VTInput::Core {

// Terminal and decoder configuration
struct TerminalConfig {
    std::string term;                                   // Empty = $TERM
    size_t bufferSize = Input::kDefaultBufferSize;
};

// Main configuration class
class Config {
public:
    Config();
    ~Config() = default;

    // Load configuration from a JSON file. A missing file keeps the
    // defaults and succeeds; unreadable or invalid JSON fails.
    bool Load(const std::string& path);

    // Parse configuration from a JSON document
    bool LoadFromString(const std::string& text);

    // Accessors
    const TerminalConfig& GetTerminal() const { return m_terminal; }
    Input::SequenceFlags GetFlags() const { return m_flags; }
    spdlog::level::level_enum GetLogLevel() const { return m_logLevel; }

    // Mutable accessors for testing
    TerminalConfig& GetTerminalMut() { return m_terminal; }

    // Driver construction parameters from this configuration
    Input::DriverOptions ToDriverOptions() const;

    bool IsLoaded() const { return m_loaded; }

    // Get any warnings from loading
    const std::vector<std::string>& GetWarnings() const { return m_warnings; }

private:
    bool ParseJson(const std::string& text);
    void SetDefaults();

    TerminalConfig m_terminal;
    Input::SequenceFlags m_flags = Input::SequenceFlags::None;
    spdlog::level::level_enum m_logLevel = spdlog::level::info;

    bool m_loaded = false;
    std::vector<std::string> m_warnings;
};

} // namespace VTInput::Core
