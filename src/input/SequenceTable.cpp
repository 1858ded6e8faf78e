#include "input/SequenceTable.h"
#include "input/ITerminfoProvider.h"
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace VTInput::Input {

namespace {

KeyEvent Sym(KeySym sym, KeyMod mod = KeyMod::None) {
    KeyEvent k;
    k.sym = sym;
    k.mod = mod;
    return k;
}

KeyEvent Rune(char32_t r, KeyMod mod = KeyMod::None) {
    KeyEvent k;
    k.runes.push_back(r);
    k.mod = mod;
    return k;
}

// Ctrl+<key> for the C0 byte b (0x00..0x1F)
char32_t CtrlRune(uint8_t b) {
    char32_t r = static_cast<char32_t>(b) + 0x40;
    if (r >= 'A' && r <= 'Z') {
        r += 'a' - 'A';
    }
    return r;
}

struct NamedFlag {
    const char* name;
    SequenceFlags flag;
};

constexpr NamedFlag kFlagNames[] = {
    {"ctrl-at", SequenceFlags::CtrlAt},
    {"ctrl-i", SequenceFlags::CtrlI},
    {"ctrl-m", SequenceFlags::CtrlM},
    {"ctrl-open-bracket", SequenceFlags::CtrlOpenBracket},
    {"space", SequenceFlags::Space},
    {"backspace", SequenceFlags::Backspace},
    {"find", SequenceFlags::Find},
    {"select", SequenceFlags::Select},
    {"no-xterm", SequenceFlags::NoXTerm},
    {"no-terminfo", SequenceFlags::NoTerminfo},
    {"fkeys", SequenceFlags::FKeys},
};

// Terminfo capability suffixes for modified keys: kUP is Shift, kUP3 is
// Alt, ... kUP8 is Shift+Alt+Ctrl. The suffix is the XTerm parameter.
const std::pair<const char*, KeyMod> kTerminfoModSuffixes[] = {
    {"", KeyMod::Shift},
    {"3", KeyMod::Alt},
    {"4", KeyMod::Shift | KeyMod::Alt},
    {"5", KeyMod::Ctrl},
    {"6", KeyMod::Shift | KeyMod::Ctrl},
    {"7", KeyMod::Alt | KeyMod::Ctrl},
    {"8", KeyMod::Shift | KeyMod::Alt | KeyMod::Ctrl},
};

} // namespace

std::optional<SequenceFlags> ParseSequenceFlag(const std::string& name) {
    for (const auto& entry : kFlagNames) {
        if (name == entry.name) {
            return entry.flag;
        }
    }
    return std::nullopt;
}

SequenceTable SequenceTable::Build(const std::string& term,
                                   SequenceFlags flags,
                                   const ITerminfoProvider* terminfo) {
    SequenceTable table;
    table.m_term = term;
    table.m_flags = flags;

    table.RegisterDefaults();
    // Alt variants must come after URxvt keys and before XTerm keys
    table.RegisterAltVariants();

    if (!HasFlag(flags, SequenceFlags::NoXTerm)) {
        table.RegisterXTermModifiers();
    }

    if (terminfo && !HasFlag(flags, SequenceFlags::NoTerminfo)) {
        table.RegisterTerminfo(*terminfo);
    }

    spdlog::debug("SequenceTable: {} sequences for term '{}' (flags 0x{:x})",
                  table.m_entries.size(), term, static_cast<uint32_t>(flags));
    return table;
}

std::optional<KeyEvent> SequenceTable::Lookup(std::string_view seq) const {
    auto it = m_entries.find(std::string(seq));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SequenceTable::RegisterDefaults() {
    // Keys whose encoding depends on flags
    KeyEvent nul = Sym(KeySym::Space, KeyMod::Ctrl);
    if (HasFlag(m_flags, SequenceFlags::Space)) {
        nul = Rune(' ', KeyMod::Ctrl);
    }
    if (HasFlag(m_flags, SequenceFlags::CtrlAt)) {
        nul = Rune('@', KeyMod::Ctrl);
    }

    KeyEvent tab = HasFlag(m_flags, SequenceFlags::CtrlI) ? Rune('i', KeyMod::Ctrl) : Sym(KeySym::Tab);
    KeyEvent enter = HasFlag(m_flags, SequenceFlags::CtrlM) ? Rune('m', KeyMod::Ctrl) : Sym(KeySym::Enter);
    KeyEvent esc = HasFlag(m_flags, SequenceFlags::CtrlOpenBracket) ? Rune('[', KeyMod::Ctrl) : Sym(KeySym::Escape);

    KeyEvent space = Sym(KeySym::Space);
    space.runes = U" ";
    if (HasFlag(m_flags, SequenceFlags::Space)) {
        space = Rune(' ');
    }

    KeyEvent bs = Rune('h', KeyMod::Ctrl);
    KeyEvent del = Sym(KeySym::Backspace);
    if (HasFlag(m_flags, SequenceFlags::Backspace)) {
        bs = Sym(KeySym::Backspace);
        del = Sym(KeySym::Delete);
    }

    KeyEvent find = Sym(HasFlag(m_flags, SequenceFlags::Find) ? KeySym::Find : KeySym::Home);
    KeyEvent select = Sym(HasFlag(m_flags, SequenceFlags::Select) ? KeySym::Select : KeySym::End);

    // C0 control characters
    for (uint8_t b = 0x01; b <= 0x1F; ++b) {
        m_entries[std::string(1, static_cast<char>(b))] = Rune(CtrlRune(b), KeyMod::Ctrl);
    }
    m_entries[std::string(1, '\0')] = nul;
    m_entries["\x08"] = bs;
    m_entries["\x09"] = tab;
    m_entries["\x0d"] = enter;
    m_entries["\x1b"] = esc;
    m_entries[" "] = space;
    m_entries["\x7f"] = del;

    // 8-bit C1 controls that don't introduce a sequence: Ctrl+Alt+<key>
    for (int b = 0x80; b <= 0x9F; ++b) {
        if (b == 0x8F || b == 0x90 || b == 0x9B || b == 0x9D || b == 0x9F) {
            continue;
        }
        m_entries[std::string(1, static_cast<char>(b))] =
            Rune(CtrlRune(static_cast<uint8_t>(b - 0x80)), KeyMod::Ctrl | KeyMod::Alt);
    }

    m_entries["\x1b[Z"] = Sym(KeySym::Tab, KeyMod::Shift);

    // CSI <number> ~ editing and function keys
    const std::vector<std::pair<std::string, KeyEvent>> tildeKeys = {
        {"1", find},
        {"2", Sym(KeySym::Insert)},
        {"3", Sym(KeySym::Delete)},
        {"4", select},
        {"5", Sym(KeySym::PgUp)},
        {"6", Sym(KeySym::PgDown)},
        {"7", Sym(KeySym::Home)},
        {"8", Sym(KeySym::End)},
        {"11", Sym(KeySym::F1)},
        {"12", Sym(KeySym::F2)},
        {"13", Sym(KeySym::F3)},
        {"14", Sym(KeySym::F4)},
        {"15", Sym(KeySym::F5)},
        {"17", Sym(KeySym::F6)},
        {"18", Sym(KeySym::F7)},
        {"19", Sym(KeySym::F8)},
        {"20", Sym(KeySym::F9)},
        {"21", Sym(KeySym::F10)},
        {"23", Sym(KeySym::F11)},
        {"24", Sym(KeySym::F12)},
    };
    // VT220 F13-F20, only sent unmodified by URxvt-style terminals
    const std::vector<std::pair<std::string, KeySym>> highFunctionKeys = {
        {"25", KeySym::F13},
        {"26", KeySym::F14},
        {"28", KeySym::F15},
        {"29", KeySym::F16},
        {"31", KeySym::F17},
        {"32", KeySym::F18},
        {"33", KeySym::F19},
        {"34", KeySym::F20},
    };

    for (const auto& [num, key] : tildeKeys) {
        m_entries["\x1b[" + num + "~"] = key;
    }
    for (const auto& [num, sym] : highFunctionKeys) {
        m_entries["\x1b[" + num + "~"] = Sym(sym);
    }

    // Normal cursor mode and VT100 PF1-PF4
    const std::vector<std::pair<char, KeySym>> cursorKeys = {
        {'A', KeySym::Up},
        {'B', KeySym::Down},
        {'C', KeySym::Right},
        {'D', KeySym::Left},
        {'E', KeySym::Begin},
        {'F', KeySym::End},
        {'H', KeySym::Home},
        {'P', KeySym::F1},
        {'Q', KeySym::F2},
        {'R', KeySym::F3},
        {'S', KeySym::F4},
    };
    for (const auto& [final, sym] : cursorKeys) {
        m_entries[std::string("\x1b[") + final] = Sym(sym);
        // Application cursor mode (DECCKM)
        m_entries[std::string("\x1bO") + final] = Sym(sym);
    }

    // Keypad application mode (DECKPAM)
    const std::vector<std::pair<char, KeySym>> keypadKeys = {
        {'M', KeySym::KpEnter},
        {'X', KeySym::KpEqual},
        {'j', KeySym::KpMultiply},
        {'k', KeySym::KpPlus},
        {'l', KeySym::KpComma},
        {'m', KeySym::KpMinus},
        {'n', KeySym::KpDecimal},
        {'o', KeySym::KpDivide},
        {'p', KeySym::Kp0},
        {'q', KeySym::Kp1},
        {'r', KeySym::Kp2},
        {'s', KeySym::Kp3},
        {'t', KeySym::Kp4},
        {'u', KeySym::Kp5},
        {'v', KeySym::Kp6},
        {'w', KeySym::Kp7},
        {'x', KeySym::Kp8},
        {'y', KeySym::Kp9},
    };
    for (const auto& [final, sym] : keypadKeys) {
        m_entries[std::string("\x1bO") + final] = Sym(sym);
    }

    // URxvt shifted and controlled arrows
    const std::vector<std::pair<char, KeySym>> urxvtArrows = {
        {'a', KeySym::Up},
        {'b', KeySym::Down},
        {'c', KeySym::Right},
        {'d', KeySym::Left},
    };
    for (const auto& [final, sym] : urxvtArrows) {
        m_entries[std::string("\x1b[") + final] = Sym(sym, KeyMod::Shift);
        m_entries[std::string("\x1bO") + final] = Sym(sym, KeyMod::Ctrl);
    }

    // URxvt modified CSI ~ keys: $ Shift, ^ Ctrl, @ Ctrl+Shift.
    // URxvt reports Shift+F1/F2 as F11/F12; nothing can be done about it.
    auto registerUrxvt = [this](const std::string& num, KeyEvent key) {
        key.mod = KeyMod::Shift;
        m_entries["\x1b[" + num + "$"] = key;
        key.mod = KeyMod::Ctrl;
        m_entries["\x1b[" + num + "^"] = key;
        key.mod = KeyMod::Ctrl | KeyMod::Shift;
        m_entries["\x1b[" + num + "@"] = key;
    };
    for (const auto& [num, key] : tildeKeys) {
        registerUrxvt(num, key);
    }
    for (const auto& [num, sym] : highFunctionKeys) {
        registerUrxvt(num, Sym(sym));
    }
}

void SequenceTable::RegisterAltVariants() {
    std::vector<std::pair<std::string, KeyEvent>> alt;
    alt.reserve(m_entries.size());
    for (const auto& [seq, key] : m_entries) {
        KeyEvent k = key;
        k.mod |= KeyMod::Alt;
        alt.emplace_back("\x1b" + seq, k);
    }
    for (auto& [seq, key] : alt) {
        m_entries[seq] = std::move(key);
    }
}

void SequenceTable::RegisterXTermModifiers() {
    KeyEvent find = Sym(HasFlag(m_flags, SequenceFlags::Find) ? KeySym::Find : KeySym::Home);
    KeyEvent select = Sym(HasFlag(m_flags, SequenceFlags::Select) ? KeySym::Select : KeySym::End);

    const std::vector<std::pair<std::string, KeyEvent>> tildeKeys = {
        {"1", find},
        {"2", Sym(KeySym::Insert)},
        {"3", Sym(KeySym::Delete)},
        {"4", select},
        {"5", Sym(KeySym::PgUp)},
        {"6", Sym(KeySym::PgDown)},
        {"7", Sym(KeySym::Home)},
        {"8", Sym(KeySym::End)},
        {"11", Sym(KeySym::F1)},
        {"12", Sym(KeySym::F2)},
        {"13", Sym(KeySym::F3)},
        {"14", Sym(KeySym::F4)},
        {"15", Sym(KeySym::F5)},
        {"17", Sym(KeySym::F6)},
        {"18", Sym(KeySym::F7)},
        {"19", Sym(KeySym::F8)},
        {"20", Sym(KeySym::F9)},
        {"21", Sym(KeySym::F10)},
        {"23", Sym(KeySym::F11)},
        {"24", Sym(KeySym::F12)},
    };

    const std::vector<std::pair<char, KeySym>> funcKeys = {
        {'A', KeySym::Up},
        {'B', KeySym::Down},
        {'C', KeySym::Right},
        {'D', KeySym::Left},
        {'E', KeySym::Begin},
        {'F', KeySym::End},
        {'H', KeySym::Home},
        {'P', KeySym::F1},
        {'Q', KeySym::F2},
        {'R', KeySym::F3},
        {'S', KeySym::F4},
    };

    // Keypad keys in SS3 form (from foot's keymap and XTerm)
    const std::vector<std::pair<char, KeySym>> ss3Keys = {
        {'M', KeySym::KpEnter},
        {'X', KeySym::KpEqual},
        {'j', KeySym::KpMultiply},
        {'k', KeySym::KpPlus},
        {'l', KeySym::KpComma},
        {'m', KeySym::KpMinus},
        {'n', KeySym::KpDecimal},
        {'o', KeySym::KpDivide},
        {'p', KeySym::Kp0},
        {'q', KeySym::Kp1},
        {'r', KeySym::Kp2},
        {'s', KeySym::Kp3},
        {'t', KeySym::Kp4},
        {'u', KeySym::Kp5},
        {'v', KeySym::Kp6},
        {'w', KeySym::Kp7},
        {'x', KeySym::Kp8},
        {'y', KeySym::Kp9},
    };

    // modifyOtherKeys: CSI 27 ; <modifier> ; <code> ~
    const std::vector<std::pair<int, KeySym>> otherKeys = {
        {0x08, KeySym::Backspace},
        {0x09, KeySym::Tab},
        {0x0D, KeySym::Enter},
        {0x1B, KeySym::Escape},
        {0x7F, KeySym::Backspace},
    };

    // XTerm modifier parameters 2..16 encode the mask plus one
    for (int mask = 1; mask <= 15; ++mask) {
        KeyMod mod = static_cast<KeyMod>(mask);
        std::string param = std::to_string(mask + 1);

        for (const auto& [final, sym] : funcKeys) {
            // CSI 1 ; <modifier> <func>
            m_entries["\x1b[1;" + param + final] = Sym(sym, mod);
            // SS3 <modifier> <func>, sent by some terminals for PF1-PF4
            m_entries["\x1bO" + param + final] = Sym(sym, mod);
        }
        for (const auto& [final, sym] : ss3Keys) {
            m_entries["\x1bO" + param + final] = Sym(sym, mod);
        }
        for (const auto& [num, key] : tildeKeys) {
            KeyEvent k = key;
            k.mod = mod;
            m_entries["\x1b[" + num + ";" + param + "~"] = k;
        }
        for (const auto& [code, sym] : otherKeys) {
            m_entries["\x1b[27;" + param + ";" + std::to_string(code) + "~"] = Sym(sym, mod);
        }
    }
}

KeyEvent SequenceTable::TerminfoFunctionKey(int n) const {
    if (n <= 12 || HasFlag(m_flags, SequenceFlags::FKeys)) {
        return Sym(FunctionKey(n));
    }

    // Fold F13-F63 into modified F1-F12, the way terminfo describes them
    if (n <= 24) return Sym(FunctionKey(n - 12), KeyMod::Shift);
    if (n <= 36) return Sym(FunctionKey(n - 24), KeyMod::Ctrl);
    if (n <= 48) return Sym(FunctionKey(n - 36), KeyMod::Ctrl | KeyMod::Shift);
    if (n <= 60) return Sym(FunctionKey(n - 48), KeyMod::Alt);
    return Sym(FunctionKey(n - 60), KeyMod::Alt | KeyMod::Shift);
}

void SequenceTable::RegisterTerminfo(const ITerminfoProvider& terminfo) {
    std::unordered_map<std::string, std::string> caps = terminfo.GetStringCapabilities(m_term);
    if (caps.empty()) {
        spdlog::debug("SequenceTable: no terminfo capabilities for '{}'", m_term);
        return;
    }

    std::unordered_map<std::string, KeyEvent> keys = {
        {"kcuu1", Sym(KeySym::Up)},
        {"kcud1", Sym(KeySym::Down)},
        {"kcub1", Sym(KeySym::Left)},
        {"kcuf1", Sym(KeySym::Right)},
        {"khome", Sym(KeySym::Home)},
        {"kend", Sym(KeySym::End)},
        {"kich1", Sym(KeySym::Insert)},
        {"kdch1", Sym(KeySym::Delete)},
        {"kpp", Sym(KeySym::PgUp)},
        {"knp", Sym(KeySym::PgDown)},
        {"kbeg", Sym(KeySym::Begin)},
        {"kfnd", Sym(KeySym::Find)},
        {"kslt", Sym(KeySym::Select)},
        {"kbs", Sym(KeySym::Backspace)},
        {"kcbt", Sym(KeySym::Tab, KeyMod::Shift)},
        {"kent", Sym(KeySym::KpEnter)},
        {"ka1", Sym(KeySym::KpHome)},
        {"ka3", Sym(KeySym::KpPgUp)},
        {"kb2", Sym(KeySym::KpBegin)},
        {"kc1", Sym(KeySym::KpEnd)},
        {"kc3", Sym(KeySym::KpPgDown)},
    };

    // Modified variants: kUP, kUP3..kUP8 and friends
    const std::pair<const char*, KeySym> modifiedBases[] = {
        {"kUP", KeySym::Up},
        {"kDN", KeySym::Down},
        {"kLFT", KeySym::Left},
        {"kRIT", KeySym::Right},
        {"kHOM", KeySym::Home},
        {"kEND", KeySym::End},
        {"kIC", KeySym::Insert},
        {"kDC", KeySym::Delete},
        {"kPRV", KeySym::PgUp},
        {"kNXT", KeySym::PgDown},
        {"kBEG", KeySym::Begin},
    };
    for (const auto& [base, sym] : modifiedBases) {
        for (const auto& [suffix, mod] : kTerminfoModSuffixes) {
            keys[std::string(base) + suffix] = Sym(sym, mod);
        }
    }

    for (int n = 1; n <= 63; ++n) {
        keys["kf" + std::to_string(n)] = TerminfoFunctionKey(n);
    }

    size_t applied = 0;
    for (const auto& [cap, seq] : caps) {
        auto it = keys.find(cap);
        if (it == keys.end() || seq.empty()) {
            continue;
        }
        m_entries[seq] = it->second;
        ++applied;
    }

    spdlog::debug("SequenceTable: applied {} terminfo key capabilities for '{}'", applied, m_term);
}

} // namespace VTInput::Input
