/*
 * fontflags.h — FontDescriptor /Flags derivation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FONTEMBED_FONTFLAGS_H
#define FONTEMBED_FONTFLAGS_H

class FontHandle;

// PDF font flags (PDF32000-2008, Table 123)
namespace FontFlags {
enum : int {
    FixedPitch  = 1 << 0,
    Serif       = 1 << 1,
    Symbolic    = 1 << 2,
    Script      = 1 << 3,
    Nonsymbolic = 1 << 5,
    Italic      = 1 << 6,
    AllCap      = 1 << 16,
    SmallCap    = 1 << 17,
    ForceBold   = 1 << 18,
};
} // namespace FontFlags

int deriveFontFlags(const FontHandle &font);

#endif // FONTEMBED_FONTFLAGS_H
