#pragma once
#include <jnibridge/throwable.h>
#include <string>
#include <jni.h>

namespace jnibridge {

    inline int UTFToCodePointLength(const char * cur, const char * end) {
        auto c = (unsigned char)*cur;
        int size;
        if((c & 0b10000000) == 0) {
            // Single ascii char
            return 1;
        } else if((c & 0b11100000) == 0b11000000) {
            size = 2;
        } else if((c & 0b11110000) == 0b11100000) {
            size = 3;
        } else if((c & 0b11111000) == 0b11110000) {
            size = 4;
        } else {
            throw JavaError("UtfDataFormatError");
        }
        if(end - cur < size) {
            throw JavaError("UtfDataFormatError");
        }
        for(int i = 1; i < size; i++) {
            if((cur[i] & 0b11000000) != 0b10000000) {
                throw JavaError("UtfDataFormatError");
            }
        }
        return size;
    }

    inline char32_t UTFToCodePoint(const char * cur, const char * end, int& size) {
        size = UTFToCodePointLength(cur, end);
        auto c = (unsigned char)*cur;
        switch (size)
        {
        case 1:
            return c;
        case 2:
            return ((c & 0x1F) << 6) | (cur[1] & 0x3F);
        case 3:
            return ((c & 0x0F) << 12) | ((cur[1] & 0x3F) << 6) | (cur[2] & 0x3F);
        default:
            return ((c & 0x07) << 18) | ((cur[1] & 0x3F) << 12) | ((cur[2] & 0x3F) << 6) | (cur[3] & 0x3F);
        }
    }

    inline void CodePointToUTF(char32_t c, std::string & out) {
        if(c < 0x80) {
            out += (char)c;
        } else if(c < 0x800) {
            out += (char)(0b11000000 | (c >> 6));
            out += (char)(0b10000000 | (c & 0x3F));
        } else if(c < 0x10000) {
            out += (char)(0b11100000 | (c >> 12));
            out += (char)(0b10000000 | ((c >> 6) & 0x3F));
            out += (char)(0b10000000 | (c & 0x3F));
        } else {
            out += (char)(0b11110000 | (c >> 18));
            out += (char)(0b10000000 | ((c >> 12) & 0x3F));
            out += (char)(0b10000000 | ((c >> 6) & 0x3F));
            out += (char)(0b10000000 | (c & 0x3F));
        }
    }

    inline std::u16string UTFToJChars(const std::string & str) {
        std::u16string result;
        result.reserve(str.length());
        auto cur = str.data(), end = cur + str.length();
        while(cur != end) {
            int size;
            auto c = UTFToCodePoint(cur, end, size);
            cur += size;
            if(c >= 0x10000) {
                // Surrogate pair
                c -= 0x10000;
                result += (char16_t)(0xD800 + (c >> 10));
                result += (char16_t)(0xDC00 + (c & 0x3FF));
            } else {
                result += (char16_t)c;
            }
        }
        return result;
    }

    inline std::string JCharsToUTF(const jchar * str, jsize length) {
        std::string result;
        result.reserve(length);
        for(jsize i = 0; i < length; i++) {
            char32_t c = str[i];
            if(c >= 0xD800 && c < 0xDC00 && i + 1 < length && str[i + 1] >= 0xDC00 && str[i + 1] < 0xE000) {
                c = 0x10000 + ((c - 0xD800) << 10) + (str[i + 1] - 0xDC00);
                i++;
            }
            CodePointToUTF(c, result);
        }
        return result;
    }

    // A char slot takes exactly one utf-16 unit
    inline jchar UTFToJChar(const std::string & str) {
        auto chars = UTFToJChars(str);
        if(chars.length() != 1) {
            throw TypeError("Failed to convert string of length " + std::to_string(chars.length()) + " to char");
        }
        return (jchar)chars[0];
    }

    inline std::string JCharToUTF(jchar c) {
        return JCharsToUTF(&c, 1);
    }
}
