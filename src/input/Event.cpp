#include "input/Event.h"
#include "input/Utf8.h"

#include <cstdint>
#include <cstdio>

namespace VTInput::Input {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string EscapeBytes(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char ch : bytes) {
        uint8_t byte = static_cast<uint8_t>(ch);
        if (byte >= 0x20 && byte < 0x7F && ch != '\\') {
            out.push_back(ch);
        } else if (ch == '\\') {
            out += "\\\\";
        } else {
            char buf[5];
            snprintf(buf, sizeof(buf), "\\x%02x", byte);
            out += buf;
        }
    }
    return out;
}

std::string EventToString(const Event& event) {
    return std::visit(Overloaded{
        [](const KeyEvent& e) { return "key: " + e.ToString(); },
        [](const MouseEvent& e) { return "mouse: " + e.ToString(); },
        [](const PasteStartEvent&) { return std::string("paste start"); },
        [](const PasteEndEvent&) { return std::string("paste end"); },
        [](const PasteEvent& e) {
            return "paste: \"" + EscapeBytes(EncodeUtf8(e.text)) + "\"";
        },
        [](const ForegroundColorEvent& e) { return "foreground color: " + e.color.ToHex(); },
        [](const BackgroundColorEvent& e) { return "background color: " + e.color.ToHex(); },
        [](const CursorColorEvent& e) { return "cursor color: " + e.color.ToHex(); },
        [](const UnknownEvent& e) { return "unknown: \"" + EscapeBytes(e.raw) + "\""; },
    }, event);
}

} // namespace VTInput::Input
