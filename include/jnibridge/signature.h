#pragma once
#include <string>
#include <vector>

namespace jnibridge {
    // Returns the end of the single type starting at cur or nullptr if it is malformed
    // V is only accepted if allowVoid is set
    const char * SkipJNIType(const char *cur, const char *end, bool allowVoid = false);

    struct MethodSignature {
        std::vector<std::string> arguments;
        std::string returnType;
    };

    // Splits (Ljava/lang/String;[II)V into its argument and return types
    MethodSignature ParseMethodSignature(const std::string & signature);
    // True if signature is exactly one field type
    bool IsTypeSignature(const std::string & signature);

    inline bool IsPrimitiveType(char c) {
        switch (c) {
        case 'Z':
        case 'B':
        case 'C':
        case 'S':
        case 'I':
        case 'J':
        case 'F':
        case 'D':
            return true;
        default:
            return false;
        }
    }

    // java.lang.String -> java/lang/String
    std::string ToSlashedName(std::string name);
    // java/lang/String -> java.lang.String
    std::string ToDottedName(std::string name);
    // Ljava/lang/String; -> java/lang/String, [I stays [I
    std::string ClassNameFromSignature(const std::string & signature);
}
