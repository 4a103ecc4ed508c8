/*
 * fontflags.cpp — FontDescriptor /Flags derivation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontflags.h"
#include "fonthandle.h"

int deriveFontFlags(const FontHandle &font)
{
    int flags = 0;
    if (font.isFixedPitch())
        flags |= FontFlags::FixedPitch;

    // IBM font classes 1-7 are the serif families, 10 is Scripts
    int familyClass = font.familyClass();
    if (familyClass >= 1 && familyClass <= 7)
        flags |= FontFlags::Serif;
    if (familyClass == 10)
        flags |= FontFlags::Script;

    // Identity-H fonts may cover characters outside the standard Latin set
    flags |= FontFlags::Symbolic;

    if (font.isItalic())
        flags |= FontFlags::Italic;
    return flags;
}
