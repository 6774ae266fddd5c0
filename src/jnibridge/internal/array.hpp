#pragma once
#include <jnibridge/throwable.h>
#include <jni.h>
#include <limits>
#include <string>

namespace jnibridge {
    // Bulk transfer functions of one primitive array type
    template<class T> struct ArrayTraits;

#define DeclareArrayTraits(T, Name, jname) template<> struct ArrayTraits<T> {\
        using Array = T##Array;\
        static constexpr const char * name = jname;\
        static constexpr auto New = &JNIEnv::New##Name##Array;\
        static constexpr auto GetRegion = &JNIEnv::Get##Name##ArrayRegion;\
        static constexpr auto SetRegion = &JNIEnv::Set##Name##ArrayRegion;\
    }
    DeclareArrayTraits(jboolean, Boolean, "boolean");
    DeclareArrayTraits(jbyte, Byte, "byte");
    DeclareArrayTraits(jchar, Char, "char");
    DeclareArrayTraits(jshort, Short, "short");
    DeclareArrayTraits(jint, Int, "int");
    DeclareArrayTraits(jlong, Long, "long");
    DeclareArrayTraits(jfloat, Float, "float");
    DeclareArrayTraits(jdouble, Double, "double");
#undef DeclareArrayTraits

    // Java arrays are indexed by jsize
    inline jsize ArrayLength(size_t size) {
        if(size > (size_t)std::numeric_limits<jsize>::max()) {
            throw JavaError("Array of size " + std::to_string(size) + " is too large for Java");
        }
        return (jsize)size;
    }
}
