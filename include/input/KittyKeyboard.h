#pragma once

#include "CsiParams.h"
#include "Key.h"

namespace VTInput::Input {

// Kitty protocol functional key code -> symbol, KeySym::None when the
// code is a plain Unicode code point
KeySym KittyKeySym(int code);

// Kitty modifier mask (the encoded parameter minus one) -> KeyMod
KeyMod FromKittyMod(int mask);

/**
 * @brief Decode a Kitty keyboard protocol report (CSI ... u).
 *
 * Layout: CSI code[:shifted[:base]] ; modifiers[:event] ; text u
 */
KeyEvent ParseKittyKeyEvent(const CsiParams& params);

} // namespace VTInput::Input
