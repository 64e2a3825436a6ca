#pragma once
// This file is part of bproj under MIT License

int constexpr ellmax_supported = 7; // letters s,p,d,f,g,h,i,j

inline char ell2letter(int const ell) { return (0 <= ell && ell <= ellmax_supported) ? "spdfghij"[ell] : '?'; }

inline int letter2ell(char const letter) {
    switch (letter | 32) { // case insensitive
        case 's': return 0;
        case 'p': return 1;
        case 'd': return 2;
        case 'f': return 3;
        case 'g': return 4;
        case 'h': return 5;
        case 'i': return 6;
        case 'j': return 7;
    } // switch
    return -1; // unknown letter
} // letter2ell
