#include "ansi.hpp"

namespace {

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

bool in_range(char c, unsigned char lo, unsigned char hi) {
    auto u = static_cast<unsigned char>(c);
    return u >= lo && u <= hi;
}

// CSI: parameter bytes 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E.
// Returns the index just past the sequence (text.size() if unterminated).
size_t skip_csi(const std::string& text, size_t i) {
    while (i < text.size() && in_range(text[i], 0x30, 0x3F)) ++i;
    while (i < text.size() && in_range(text[i], 0x20, 0x2F)) ++i;
    if (i < text.size() && in_range(text[i], 0x40, 0x7E)) ++i;
    return i;
}

// OSC/DCS/SOS/PM/APC payload up to and including BEL (OSC only) or ESC '\'.
size_t skip_string(const std::string& text, size_t i, bool bel_ends) {
    while (i < text.size()) {
        if (bel_ends && text[i] == BEL) return i + 1;
        if (text[i] == ESC) {
            if (i + 1 < text.size() && text[i + 1] == '\\') return i + 2;
            // A new escape aborts the string; let the caller handle it.
            return i;
        }
        ++i;
    }
    return i;
}

} // namespace

std::string strip_ansi(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != ESC) {
            out += c;
            ++i;
            continue;
        }

        if (i + 1 >= text.size()) break;  // lone trailing ESC
        char kind = text[i + 1];
        switch (kind) {
            case '[':
                i = skip_csi(text, i + 2);
                break;
            case ']':
                i = skip_string(text, i + 2, true);
                break;
            case 'P': case 'X': case '^': case '_':
                i = skip_string(text, i + 2, false);
                break;
            default: {
                // nF: intermediates then a final byte; Fp/Fe/Fs: single byte.
                size_t j = i + 1;
                while (j < text.size() && in_range(text[j], 0x20, 0x2F)) ++j;
                if (j < text.size() && in_range(text[j], 0x30, 0x7E)) ++j;
                i = j;
                break;
            }
        }
    }
    return out;
}
