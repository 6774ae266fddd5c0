#include <jnibridge/signature.h>
#include <jnibridge/throwable.h>
#include <algorithm>

using namespace jnibridge;

const char * jnibridge::SkipJNIType(const char *cur, const char *end, bool allowVoid) {
    if(cur == end) {
        return nullptr;
    }
    switch (*cur) {
    case 'V':
        return allowVoid ? cur + 1 : nullptr;
    case 'Z':
    case 'B':
    case 'C':
    case 'S':
    case 'I':
    case 'J':
    case 'F':
    case 'D':
        return cur + 1;
    case '[':
        // Arrays of void don't exist
        return SkipJNIType(cur + 1, end, false);
    case 'L': {
        auto semicolon = std::find(cur, end, ';');
        // L; has no class name
        if(semicolon == end || semicolon == cur + 1) {
            return nullptr;
        }
        return semicolon + 1;
    }
    default:
        return nullptr;
    }
}

MethodSignature jnibridge::ParseMethodSignature(const std::string &signature) {
    auto begin = signature.data(), end = begin + signature.length();
    auto close = std::find(begin, end, ')');
    if(signature.empty() || *begin != '(' || close == end) {
        throw JavaError("Bad function signature: " + signature);
    }
    MethodSignature result;
    auto cur = begin + 1;
    while(cur != close) {
        auto next = SkipJNIType(cur, close);
        if(!next) {
            throw JavaError("Bad function signature: " + signature);
        }
        result.arguments.emplace_back(cur, next);
        cur = next;
    }
    auto ret = SkipJNIType(close + 1, end, true);
    if(ret != end) {
        throw JavaError("Bad function signature: " + signature);
    }
    result.returnType.assign(close + 1, end);
    return result;
}

bool jnibridge::IsTypeSignature(const std::string &signature) {
    auto begin = signature.data(), end = begin + signature.length();
    return SkipJNIType(begin, end) == end && !signature.empty();
}

std::string jnibridge::ToSlashedName(std::string name) {
    std::replace(name.begin(), name.end(), '.', '/');
    return name;
}

std::string jnibridge::ToDottedName(std::string name) {
    std::replace(name.begin(), name.end(), '/', '.');
    return name;
}

std::string jnibridge::ClassNameFromSignature(const std::string &signature) {
    if(signature.length() > 2 && signature.front() == 'L' && signature.back() == ';') {
        return signature.substr(1, signature.length() - 2);
    }
    return signature;
}
