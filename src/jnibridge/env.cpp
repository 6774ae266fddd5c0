#include <jnibridge/env.h>
#include <jnibridge/reaper.h>
#include <jnibridge/signature.h>
#include <jnibridge/throwable.h>
#include "internal/string.hpp"
#include "internal/log.h"

using namespace jnibridge;

LocalFrame::LocalFrame(JNIEnv *env, jint capacity) : env(env), active(false) {
    if(env->PushLocalFrame(capacity) < 0) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate local frame of size " + std::to_string(capacity));
    }
    active = true;
}

LocalFrame::~LocalFrame() {
    if(active) {
        env->PopLocalFrame(nullptr);
    }
}

void LocalFrame::Reset(jint capacity) {
    env->PopLocalFrame(nullptr);
    active = false;
    if(env->PushLocalFrame(capacity) < 0) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate local frame of size " + std::to_string(capacity));
    }
    active = true;
}

MonitorLock::MonitorLock(JNIEnv *env, jobject obj) : env(env), obj(obj) {
    if(env->MonitorEnter(obj) != JNI_OK) {
        env->ExceptionClear();
        throw JavaError("Failed to enter the monitor of the object");
    }
}

MonitorLock::~MonitorLock() {
    if(env->MonitorExit(obj) != JNI_OK) {
        LOG("JNIBridge", "MonitorExit failed");
        env->ExceptionClear();
    }
}

static std::string ReadStringUTF(JNIEnv * env, jstring str) {
    auto chars = env->GetStringUTFChars(str, nullptr);
    if(!chars) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate string");
    }
    std::string result(chars, env->GetStringUTFLength(str));
    env->ReleaseStringUTFChars(str, chars);
    return result;
}

ENV::ENV(JNIEnv *env, std::shared_ptr<Reaper> reaper) : env(env), reaper(std::move(reaper)) {
    if(!env) {
        throw LifecycleError("No environment, attach the current thread first");
    }
}

std::pair<int, int> ENV::GetVersion() {
    auto version = env->GetVersion();
    return { version / 65536, version % 65536 };
}

std::shared_ptr<Object> ENV::MakeGlobal(jobject ref) {
    if(!ref) {
        return nullptr;
    }
    auto global = env->NewGlobalRef(ref);
    if(!global) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate global reference");
    }
    return std::make_shared<Object>(global, reaper);
}

std::shared_ptr<Class> ENV::MakeGlobalClass(jclass ref) {
    if(!ref) {
        return nullptr;
    }
    auto global = (jclass)env->NewGlobalRef(ref);
    if(!global) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate global reference");
    }
    return std::make_shared<Class>(global, reaper);
}

std::shared_ptr<Object> ENV::MakeObject(jobject local) {
    auto result = MakeGlobal(local);
    if(local) {
        env->DeleteLocalRef(local);
    }
    return result;
}

std::shared_ptr<Class> ENV::MakeClass(jclass local) {
    auto result = MakeGlobalClass(local);
    if(local) {
        env->DeleteLocalRef(local);
    }
    return result;
}

std::shared_ptr<Class> ENV::FindClass(const std::string &name) {
    auto local = env->FindClass(ToSlashedName(name).data());
    ThrowIfPending();
    if(!local) {
        throw JavaError("Could not find class " + name);
    }
    return MakeClass(local);
}

std::shared_ptr<Class> ENV::GetObjectClass(const Object &obj) {
    if(!obj.GetHandle()) {
        throw JavaError("GetObjectClass called with a released object");
    }
    return MakeClass(env->GetObjectClass(obj.GetHandle()));
}

bool ENV::IsInstanceOf(const Object &obj, const Class &cl) {
    return env->IsInstanceOf(obj.GetHandle(), cl.GetHandle());
}

bool ENV::IsSameObject(const Object &a, const Object &b) {
    return env->IsSameObject(a.GetHandle(), b.GetHandle());
}

bool ENV::ExceptionCheck() {
    return env->ExceptionCheck();
}

std::string ENV::DescribeThrowable(jthrowable throwable, std::string &className) {
    // Every step may raise again, such exceptions are dropped so that the original one gets reported
    LocalFrame frame(env, 8);
    std::string message;
    auto cl = env->GetObjectClass(throwable);
    auto classclass = env->FindClass("java/lang/Class");
    if(cl && classclass && !env->ExceptionCheck()) {
        auto getName = env->GetMethodID(classclass, "getName", "()Ljava/lang/String;");
        if(getName && !env->ExceptionCheck()) {
            auto name = (jstring)env->CallObjectMethodA(cl, getName, nullptr);
            if(name && !env->ExceptionCheck()) {
                className = ReadStringUTF(env, name);
            }
        }
    }
    env->ExceptionClear();
    if(cl) {
        auto getMessage = env->GetMethodID(cl, "getMessage", "()Ljava/lang/String;");
        if(getMessage && !env->ExceptionCheck()) {
            auto msg = (jstring)env->CallObjectMethodA(throwable, getMessage, nullptr);
            if(msg && !env->ExceptionCheck()) {
                message = ReadStringUTF(env, msg);
            }
        }
    }
    env->ExceptionClear();
    return message;
}

std::shared_ptr<Object> ENV::GetCause(jthrowable throwable) {
    std::shared_ptr<Object> cause;
    {
        LocalFrame frame(env, 4);
        auto throwableclass = env->FindClass("java/lang/Throwable");
        if(throwableclass && !env->ExceptionCheck()) {
            auto getCause = env->GetMethodID(throwableclass, "getCause", "()Ljava/lang/Throwable;");
            if(getCause && !env->ExceptionCheck()) {
                auto local = env->CallObjectMethodA(throwable, getCause, nullptr);
                if(local && !env->ExceptionCheck()) {
                    cause = MakeGlobal(local);
                }
            }
        }
        env->ExceptionClear();
    }
    return cause;
}

std::optional<PendingException> ENV::TakePendingException() {
    if(!env->ExceptionCheck()) {
        return std::nullopt;
    }
    auto local = env->ExceptionOccurred();
    env->ExceptionClear();
    PendingException pending;
    pending.throwable = MakeObject(local);
    if(pending.throwable) {
        pending.message = DescribeThrowable((jthrowable)pending.throwable->GetHandle(), pending.className);
        pending.cause = GetCause((jthrowable)pending.throwable->GetHandle());
    }
    return pending;
}

void ENV::ThrowIfPending() {
    if(auto pending = TakePendingException()) {
        throw JavaException(std::move(pending->throwable), std::move(pending->className), std::move(pending->message), std::move(pending->cause));
    }
}

void ENV::Throw(const Object &throwable) {
    if(env->Throw((jthrowable)throwable.GetHandle()) != JNI_OK) {
        throw JavaError("Failed to throw the exception");
    }
}

void ENV::ThrowNew(const Class &cl, const std::string &message) {
    if(env->ThrowNew(cl.GetHandle(), message.data()) != JNI_OK) {
        throw JavaError("Failed to throw a new exception with message " + message);
    }
}

std::shared_ptr<Object> ENV::NewString(const std::u16string &str) {
    static_assert(sizeof(jchar) == sizeof(char16_t), "jchar is not as large as char16_t");
    auto local = env->NewString((const jchar*)str.data(), (jsize)str.length());
    if(!local || env->ExceptionCheck()) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate string");
    }
    return MakeObject(local);
}

std::shared_ptr<Object> ENV::NewString(const std::string &str) {
    return NewString(UTFToJChars(str));
}

std::shared_ptr<Object> ENV::NewStringUTF(const std::string &str) {
    auto local = env->NewStringUTF(str.data());
    if(!local || env->ExceptionCheck()) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate string");
    }
    return MakeObject(local);
}

std::string ENV::GetString(const Object &str) {
    auto jstr = (jstring)str.GetHandle();
    auto length = env->GetStringLength(jstr);
    auto chars = env->GetStringChars(jstr, nullptr);
    if(!chars) {
        env->ExceptionClear();
        throw OutOfMemoryError("Failed to allocate string");
    }
    auto result = JCharsToUTF(chars, length);
    env->ReleaseStringChars(jstr, chars);
    return result;
}

std::string ENV::GetStringUTF(const Object &str) {
    return ReadStringUTF(env, (jstring)str.GetHandle());
}

jsize ENV::GetStringLength(const Object &str) {
    return env->GetStringLength((jstring)str.GetHandle());
}

void ENV::RegisterNatives(const Class &cl, const std::vector<NativeMethod> &methods) {
    std::vector<JNINativeMethod> natives;
    natives.reserve(methods.size());
    for(auto&& m : methods) {
        natives.push_back({ const_cast<char*>(m.name.data()), const_cast<char*>(m.signature.data()), m.fnPtr });
    }
    auto res = env->RegisterNatives(cl.GetHandle(), natives.data(), (jint)natives.size());
    ThrowIfPending();
    if(res != JNI_OK) {
        throw JavaError("Failed to register natives, return code = " + std::to_string(res));
    }
}

std::vector<jvalue> ENV::MakeArguments(const std::string &argSignature, const std::vector<Value> &args) {
    std::vector<jvalue> jargs(args.size());
    auto sig = argSignature.data(), end = sig + argSignature.length();
    for(size_t pos = 0; pos < args.size(); pos++) {
        if(sig == end) {
            throw JavaError("# of arguments (" + std::to_string(args.size()) + ") in call did not match signature (" + argSignature + ")");
        }
        auto next = SkipJNIType(sig, end);
        if(!next) {
            throw JavaError("Bad signature: " + argSignature);
        }
        auto&& arg = args[pos];
        auto& jarg = jargs[pos];
        switch (*sig) {
        case 'Z':
            jarg.z = (jboolean)arg.AsBool();
            break;
        case 'B':
            jarg.b = (jbyte)arg.AsInt();
            break;
        case 'C':
            jarg.c = arg.IsString() ? UTFToJChar(arg.AsString()) : (jchar)arg.AsInt();
            break;
        case 'S':
            jarg.s = (jshort)arg.AsInt();
            break;
        case 'I':
            jarg.i = (jint)arg.AsInt();
            break;
        case 'J':
            jarg.j = arg.AsInt();
            break;
        case 'F':
            jarg.f = (jfloat)arg.AsDouble();
            break;
        case 'D':
            jarg.d = arg.AsDouble();
            break;
        case 'L':
        case '[':
            if(arg.IsNull()) {
                jarg.l = nullptr;
            } else if(arg.IsObject()) {
                jarg.l = arg.AsObject()->GetHandle();
            } else {
                throw JavaError(arg.ToString() + " is not a Java object");
            }
            break;
        }
        sig = next;
    }
    if(sig != end) {
        throw JavaError("Too few arguments (" + std::to_string(args.size()) + ") for signature (" + argSignature + ")");
    }
    return jargs;
}
