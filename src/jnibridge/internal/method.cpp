#include <jnibridge/env.h>
#include <jnibridge/signature.h>
#include <jnibridge/throwable.h>
#include "string.hpp"

using namespace jnibridge;

namespace {
    // Call<Type>MethodA of one receiver kind
    template<class Target> struct Calls;

    template<> struct Calls<jobject> {
        static constexpr auto Void = &JNIEnv::CallVoidMethodA;
        static constexpr auto Boolean = &JNIEnv::CallBooleanMethodA;
        static constexpr auto Byte = &JNIEnv::CallByteMethodA;
        static constexpr auto Char = &JNIEnv::CallCharMethodA;
        static constexpr auto Short = &JNIEnv::CallShortMethodA;
        static constexpr auto Int = &JNIEnv::CallIntMethodA;
        static constexpr auto Long = &JNIEnv::CallLongMethodA;
        static constexpr auto Float = &JNIEnv::CallFloatMethodA;
        static constexpr auto Double = &JNIEnv::CallDoubleMethodA;
        static constexpr auto Object = &JNIEnv::CallObjectMethodA;
    };

    template<> struct Calls<jclass> {
        static constexpr auto Void = &JNIEnv::CallStaticVoidMethodA;
        static constexpr auto Boolean = &JNIEnv::CallStaticBooleanMethodA;
        static constexpr auto Byte = &JNIEnv::CallStaticByteMethodA;
        static constexpr auto Char = &JNIEnv::CallStaticCharMethodA;
        static constexpr auto Short = &JNIEnv::CallStaticShortMethodA;
        static constexpr auto Int = &JNIEnv::CallStaticIntMethodA;
        static constexpr auto Long = &JNIEnv::CallStaticLongMethodA;
        static constexpr auto Float = &JNIEnv::CallStaticFloatMethodA;
        static constexpr auto Double = &JNIEnv::CallStaticDoubleMethodA;
        static constexpr auto Object = &JNIEnv::CallStaticObjectMethodA;
    };

    // Dispatches on the return type, the caller checks for pending exceptions
    template<class Target>
    Value Invoke(ENV & env, Target target, jmethodID id, const std::string & returnType, const jvalue * args) {
        using C = Calls<Target>;
        auto jenv = env.GetJNIEnv();
        switch (returnType[0]) {
        case 'V':
            (jenv->*C::Void)(target, id, args);
            return nullptr;
        case 'Z':
            return (bool)(jenv->*C::Boolean)(target, id, args);
        case 'B':
            return (jenv->*C::Byte)(target, id, args);
        case 'C':
            return JCharToUTF((jenv->*C::Char)(target, id, args));
        case 'S':
            return (jenv->*C::Short)(target, id, args);
        case 'I':
            return (jenv->*C::Int)(target, id, args);
        case 'J':
            return (jenv->*C::Long)(target, id, args);
        case 'F':
            return (jenv->*C::Float)(target, id, args);
        case 'D':
            return (jenv->*C::Double)(target, id, args);
        default: {
            // Keep the local reference table bounded while promoting the result
            LocalFrame frame(jenv, 1);
            auto result = (jenv->*C::Object)(target, id, args);
            if(jenv->ExceptionCheck()) {
                return nullptr;
            }
            return env.MakeGlobal(result);
        }
        }
    }
}

template<bool isStatic>
std::shared_ptr<Method> ENV::LookupMethod(const Class &cl, const std::string &name, const std::string &signature) {
    if(!cl.GetHandle()) {
        throw JavaError("Class = None on call to " + std::string(isStatic ? "GetStaticMethodID" : "GetMethodID"));
    }
    auto id = isStatic ? env->GetStaticMethodID(cl.GetHandle(), name.data(), signature.data())
                       : env->GetMethodID(cl.GetHandle(), name.data(), signature.data());
    if(!id || env->ExceptionCheck()) {
        // NoSuchMethodError
        env->ExceptionClear();
        return nullptr;
    }
    return std::make_shared<Method>(Method{ id, name, signature, isStatic });
}

std::shared_ptr<Method> ENV::GetMethodID(const Class &cl, const std::string &name, const std::string &signature) {
    return LookupMethod<false>(cl, name, signature);
}

std::shared_ptr<Method> ENV::GetStaticMethodID(const Class &cl, const std::string &name, const std::string &signature) {
    return LookupMethod<true>(cl, name, signature);
}

Method ENV::FromReflectedMethod(const Object &method, const std::string &signature, bool isStatic) {
    auto id = env->FromReflectedMethod(method.GetHandle());
    ThrowIfPending();
    if(!id) {
        throw JavaError("Failed to get a method id of the reflected method");
    }
    return Method{ id, "", signature, isStatic };
}

Value ENV::CallMethod(const Object &obj, const Method &method, const std::vector<Value> &args) {
    if(!method.id) {
        throw JavaError("Method ID is None - check your method ID call");
    }
    if(method._static) {
        throw JavaError("CallMethod called with a static method. Use CallStaticMethod instead");
    }
    if(!obj.GetHandle()) {
        throw JavaError("CallMethod called with a null object");
    }
    auto sig = ParseMethodSignature(method.signature);
    auto argSignature = method.signature.substr(1, method.signature.find(')') - 1);
    auto jargs = MakeArguments(argSignature, args);
    auto result = Invoke<jobject>(*this, obj.GetHandle(), method.id, sig.returnType, jargs.data());
    ThrowIfPending();
    return result;
}

Value ENV::CallStaticMethod(const Class &cl, const Method &method, const std::vector<Value> &args) {
    if(!method.id) {
        throw JavaError("Method ID is None - check your method ID call");
    }
    if(!method._static) {
        throw JavaError("CallStaticMethod called with an object method. Use CallMethod instead");
    }
    auto sig = ParseMethodSignature(method.signature);
    auto argSignature = method.signature.substr(1, method.signature.find(')') - 1);
    auto jargs = MakeArguments(argSignature, args);
    auto result = Invoke<jclass>(*this, cl.GetHandle(), method.id, sig.returnType, jargs.data());
    ThrowIfPending();
    return result;
}

std::shared_ptr<Object> ENV::NewObject(const Class &cl, const Method &constructor, const std::vector<Value> &args) {
    if(!constructor.id) {
        throw JavaError("Method ID is None - check your method ID call");
    }
    ParseMethodSignature(constructor.signature);
    auto argSignature = constructor.signature.substr(1, constructor.signature.find(')') - 1);
    auto jargs = MakeArguments(argSignature, args);
    std::shared_ptr<Object> result;
    {
        LocalFrame frame(env, 1);
        auto obj = env->NewObjectA(cl.GetHandle(), constructor.id, jargs.data());
        if(!env->ExceptionCheck()) {
            result = MakeGlobal(obj);
        }
    }
    ThrowIfPending();
    return result;
}
