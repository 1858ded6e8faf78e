#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "Key.h"

namespace VTInput::Input {

class ITerminfoProvider;

// Behavior flags that resolve ambiguous legacy encodings.
// Evaluated once when the table is built.
enum class SequenceFlags : uint32_t {
    None = 0,

    // NUL is Ctrl+@ instead of Ctrl+Space
    CtrlAt = 1 << 0,

    // HT is Ctrl+I instead of Tab
    CtrlI = 1 << 1,

    // CR is Ctrl+M instead of Enter
    CtrlM = 1 << 2,

    // ESC is Ctrl+[ instead of Escape
    CtrlOpenBracket = 1 << 3,

    // Space is a plain rune instead of the Space symbol
    Space = 1 << 4,

    // Backspace sends BS (0x08); DEL (0x7F) is then the Delete key
    Backspace = 1 << 5,

    // CSI 1 ~ is the VT220 Find key instead of Home
    Find = 1 << 6,

    // CSI 4 ~ is the VT220 Select key instead of End
    Select = 1 << 7,

    // Don't register XTerm modified key sequences
    NoXTerm = 1 << 8,

    // Don't apply terminfo overrides
    NoTerminfo = 1 << 9,

    // Keep terminfo F13-F63 as distinct symbols instead of folding
    // them into modified F1-F12
    FKeys = 1 << 10,
};

constexpr SequenceFlags operator|(SequenceFlags a, SequenceFlags b) {
    return static_cast<SequenceFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr SequenceFlags operator&(SequenceFlags a, SequenceFlags b) {
    return static_cast<SequenceFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline SequenceFlags& operator|=(SequenceFlags& a, SequenceFlags b) {
    a = a | b;
    return a;
}

constexpr bool HasFlag(SequenceFlags set, SequenceFlags flag) {
    return (set & flag) != SequenceFlags::None;
}

// Config name ("ctrl-at", "no-xterm", ...) -> flag
std::optional<SequenceFlags> ParseSequenceFlag(const std::string& name);

/**
 * @brief Immutable map from exact byte sequences to key events.
 *
 * Built once from VT100/VT220/XTerm/URxvt defaults, optional terminfo
 * overrides and behavior flags. Lookups are exact-match only; prefix and
 * grammar based decoding is the parser's job.
 */
class SequenceTable {
public:
    SequenceTable() = default;

    static SequenceTable Build(const std::string& term,
                               SequenceFlags flags,
                               const ITerminfoProvider* terminfo = nullptr);

    std::optional<KeyEvent> Lookup(std::string_view seq) const;

    size_t Size() const { return m_entries.size(); }
    SequenceFlags GetFlags() const { return m_flags; }
    const std::string& GetTerm() const { return m_term; }
    const std::unordered_map<std::string, KeyEvent>& GetEntries() const { return m_entries; }

private:
    void RegisterDefaults();
    void RegisterAltVariants();
    void RegisterXTermModifiers();
    void RegisterTerminfo(const ITerminfoProvider& terminfo);

    KeyEvent TerminfoFunctionKey(int n) const;

    std::string m_term;
    SequenceFlags m_flags = SequenceFlags::None;
    std::unordered_map<std::string, KeyEvent> m_entries;
};

} // namespace VTInput::Input
