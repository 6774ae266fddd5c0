#pragma once
#include <string>
#include <jni.h>

namespace jnibridge {
    // Resolved method id, _static follows the lookup used to obtain it
    struct Method {
        jmethodID id = nullptr;
        std::string name;
        std::string signature;
        bool _static = false;
    };

    struct Field {
        jfieldID id = nullptr;
        std::string name;
        std::string signature;
        bool _static = false;
    };
}
