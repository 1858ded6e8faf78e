#include "core/Config.h"
#include "input/Driver.h"
#include "source/FdByteSource.h"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <unistd.h>

using namespace VTInput;

namespace {

// Ctrl+C only arrives as a key when the terminal is in raw mode
bool IsQuitKey(const Input::Event& event) {
    const auto* key = std::get_if<Input::KeyEvent>(&event);
    return key && key->mod == Input::KeyMod::Ctrl && key->runes == U"c";
}

} // namespace

int main(int argc, char* argv[]) {
    // Usage: vtinput-dump [config.json]
    Core::Config config;
    if (argc > 1 && !config.Load(argv[1])) {
        spdlog::error("Failed to load config: {}", argv[1]);
        return EXIT_FAILURE;
    }
    spdlog::set_level(config.GetLogLevel());

    auto source = std::make_unique<Source::FdByteSource>(STDIN_FILENO);
    if (!source->IsValid()) {
        spdlog::error("Failed to set up standard input");
        return EXIT_FAILURE;
    }

    Input::DriverOptions options = config.ToDriverOptions();
    Input::Driver driver(std::move(source), options);
    spdlog::info("Decoding input for term '{}', end of input or Ctrl+C quits", options.term);

    Input::EventList events;
    while (true) {
        Source::ReadStatus status = driver.ReadEvents(events);
        if (status == Source::ReadStatus::EndOfStream) {
            break;
        }
        if (status != Source::ReadStatus::Ok) {
            spdlog::error("Input stopped");
            return EXIT_FAILURE;
        }

        for (const auto& event : events) {
            spdlog::info("{}", Input::EventToString(event));
            if (IsQuitKey(event)) {
                return EXIT_SUCCESS;
            }
        }
    }

    return EXIT_SUCCESS;
}
