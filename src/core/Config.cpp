#include "core/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace VTInput::Core {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxBufferSize = 64 * 1024;

} // namespace

Config::Config() {
    SetDefaults();
}

void Config::SetDefaults() {
    m_terminal = TerminalConfig{};
    if (const char* term = std::getenv("TERM")) {
        m_terminal.term = term;
    }
    m_flags = Input::SequenceFlags::None;
    m_logLevel = spdlog::level::info;
    m_warnings.clear();
}

bool Config::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::info("Config file not found: {}, using defaults", path);
        SetDefaults();
        m_loaded = false;
        return true;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        spdlog::error("Failed to read config file: {}", path);
        return false;
    }

    if (!LoadFromString(contents.str())) {
        spdlog::error("Invalid config file: {}", path);
        return false;
    }

    spdlog::info("Loaded config from {}", path);
    return true;
}

bool Config::LoadFromString(const std::string& text) {
    SetDefaults();
    m_loaded = ParseJson(text);
    for (const auto& warning : m_warnings) {
        spdlog::warn("Config: {}", warning);
    }
    return m_loaded;
}

bool Config::ParseJson(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        m_warnings.push_back(std::string("JSON parse error: ") + e.what());
        return false;
    }

    if (!doc.is_object()) {
        m_warnings.push_back("Top-level value must be an object");
        return false;
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        if (key != "terminal" && key != "flags" && key != "logLevel") {
            m_warnings.push_back("Unknown key '" + key + "'");
        }
    }

    // Terminal section
    if (doc.contains("terminal")) {
        const json& terminal = doc["terminal"];
        if (!terminal.is_object()) {
            m_warnings.push_back("'terminal' must be an object");
        } else {
            for (auto it = terminal.begin(); it != terminal.end(); ++it) {
                if (it.key() != "term" && it.key() != "bufferSize") {
                    m_warnings.push_back("Unknown key 'terminal." + it.key() + "'");
                }
            }

            if (terminal.contains("term")) {
                if (terminal["term"].is_string()) {
                    m_terminal.term = terminal["term"].get<std::string>();
                } else {
                    m_warnings.push_back("'terminal.term' must be a string");
                }
            }

            if (terminal.contains("bufferSize")) {
                const json& size = terminal["bufferSize"];
                if (!size.is_number_integer()) {
                    m_warnings.push_back("'terminal.bufferSize' must be an integer");
                } else {
                    long long value = size.get<long long>();
                    if (value < static_cast<long long>(Input::kMinBufferSize) ||
                        value > static_cast<long long>(kMaxBufferSize)) {
                        m_warnings.push_back("'terminal.bufferSize' " + std::to_string(value) +
                                             " out of range, using " +
                                             std::to_string(Input::kDefaultBufferSize));
                    } else {
                        m_terminal.bufferSize = static_cast<size_t>(value);
                    }
                }
            }
        }
    }

    // Behavior flags
    if (doc.contains("flags")) {
        const json& flags = doc["flags"];
        if (!flags.is_array()) {
            m_warnings.push_back("'flags' must be an array of strings");
        } else {
            for (const auto& flag : flags) {
                if (!flag.is_string()) {
                    m_warnings.push_back("Ignoring non-string flag");
                    continue;
                }
                std::string name = flag.get<std::string>();
                if (auto parsed = Input::ParseSequenceFlag(name)) {
                    m_flags |= *parsed;
                } else {
                    m_warnings.push_back("Unknown flag '" + name + "'");
                }
            }
        }
    }

    if (doc.contains("logLevel")) {
        const json& level = doc["logLevel"];
        if (!level.is_string()) {
            m_warnings.push_back("'logLevel' must be a string");
        } else {
            std::string name = level.get<std::string>();
            spdlog::level::level_enum parsed = spdlog::level::from_str(name);
            // from_str maps anything it doesn't know to off
            if (parsed == spdlog::level::off && name != "off") {
                m_warnings.push_back("Unknown log level '" + name + "'");
            } else {
                m_logLevel = parsed;
            }
        }
    }

    return true;
}

Input::DriverOptions Config::ToDriverOptions() const {
    Input::DriverOptions options;
    options.term = m_terminal.term;
    options.flags = m_flags;
    options.bufferSize = m_terminal.bufferSize;
    return options;
}

} // namespace VTInput::Core
