#include <jnibridge/env.h>
#include <jnibridge/throwable.h>
#include "array.hpp"

using namespace jnibridge;

jsize ENV::GetArrayLength(const Object &array) {
    return array.GetHandle() ? env->GetArrayLength((jarray)array.GetHandle()) : 0;
}

template<class T>
std::shared_ptr<Object> ENV::MakeArray(const std::vector<T> &values) {
    using A = ArrayTraits<T>;
    auto size = ArrayLength(values.size());
    LocalFrame frame(env, 1);
    auto arr = (env->*A::New)(size);
    if(!arr || env->ExceptionCheck()) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate " + std::string(A::name) + " array of size " + std::to_string(size));
    }
    (env->*A::SetRegion)(arr, 0, size, values.data());
    ThrowIfPending();
    return MakeGlobal(arr);
}

template<class T>
std::vector<T> ENV::GetArrayElements(const Object &array) {
    using A = ArrayTraits<T>;
    auto arr = (typename A::Array)array.GetHandle();
    std::vector<T> result(GetArrayLength(array));
    (env->*A::GetRegion)(arr, 0, (jsize)result.size(), result.data());
    ThrowIfPending();
    return result;
}

std::shared_ptr<Object> ENV::MakeObjectArray(jsize length, const Class &cl) {
    if(length < 0) {
        throw JavaError("Negative array size " + std::to_string(length));
    }
    LocalFrame frame(env, 1);
    auto arr = env->NewObjectArray(length, cl.GetHandle(), nullptr);
    if(!arr || env->ExceptionCheck()) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate object array of size " + std::to_string(length));
    }
    return MakeGlobal(arr);
}

std::vector<std::shared_ptr<Object>> ENV::GetObjectArrayElements(const Object &array) {
    std::vector<std::shared_ptr<Object>> result;
    auto size = GetArrayLength(array);
    result.reserve(size);
    LocalFrame frame(env, 256);
    for(jsize i = 0; i < size; i++) {
        // Every element leaves a local reference behind
        if(i && !(i % 256)) {
            frame.Reset(256);
        }
        auto obj = env->GetObjectArrayElement((jobjectArray)array.GetHandle(), i);
        ThrowIfPending();
        result.push_back(MakeGlobal(obj));
    }
    return result;
}

std::shared_ptr<Object> ENV::GetObjectArrayElement(const Object &array, jsize index) {
    auto obj = env->GetObjectArrayElement((jobjectArray)array.GetHandle(), index);
    ThrowIfPending();
    return MakeObject(obj);
}

void ENV::SetObjectArrayElement(const Object &array, jsize index, const std::shared_ptr<Object> &value) {
    env->SetObjectArrayElement((jobjectArray)array.GetHandle(), index, value ? value->GetHandle() : nullptr);
    ThrowIfPending();
}

#define DeclareTemplate(T) template std::shared_ptr<Object> ENV::MakeArray<T>(const std::vector<T> &values)
DeclareTemplate(jboolean);
DeclareTemplate(jbyte);
DeclareTemplate(jchar);
DeclareTemplate(jshort);
DeclareTemplate(jint);
DeclareTemplate(jlong);
DeclareTemplate(jfloat);
DeclareTemplate(jdouble);
#undef DeclareTemplate

#define DeclareTemplate(T) template std::vector<T> ENV::GetArrayElements<T>(const Object &array)
DeclareTemplate(jboolean);
DeclareTemplate(jbyte);
DeclareTemplate(jchar);
DeclareTemplate(jshort);
DeclareTemplate(jint);
DeclareTemplate(jlong);
DeclareTemplate(jfloat);
DeclareTemplate(jdouble);
#undef DeclareTemplate
