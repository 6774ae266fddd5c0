#include <jnibridge/env.h>
#include <jnibridge/signature.h>
#include <jnibridge/throwable.h>
#include "string.hpp"

using namespace jnibridge;

namespace {
    // Get/Set<Type>Field of one receiver kind
    template<class Target> struct Fields;

    template<> struct Fields<jobject> {
        static constexpr auto GetBoolean = &JNIEnv::GetBooleanField;
        static constexpr auto GetByte = &JNIEnv::GetByteField;
        static constexpr auto GetChar = &JNIEnv::GetCharField;
        static constexpr auto GetShort = &JNIEnv::GetShortField;
        static constexpr auto GetInt = &JNIEnv::GetIntField;
        static constexpr auto GetLong = &JNIEnv::GetLongField;
        static constexpr auto GetFloat = &JNIEnv::GetFloatField;
        static constexpr auto GetDouble = &JNIEnv::GetDoubleField;
        static constexpr auto GetObject = &JNIEnv::GetObjectField;
        static constexpr auto SetBoolean = &JNIEnv::SetBooleanField;
        static constexpr auto SetByte = &JNIEnv::SetByteField;
        static constexpr auto SetChar = &JNIEnv::SetCharField;
        static constexpr auto SetShort = &JNIEnv::SetShortField;
        static constexpr auto SetInt = &JNIEnv::SetIntField;
        static constexpr auto SetLong = &JNIEnv::SetLongField;
        static constexpr auto SetFloat = &JNIEnv::SetFloatField;
        static constexpr auto SetDouble = &JNIEnv::SetDoubleField;
        static constexpr auto SetObject = &JNIEnv::SetObjectField;
    };

    template<> struct Fields<jclass> {
        static constexpr auto GetBoolean = &JNIEnv::GetStaticBooleanField;
        static constexpr auto GetByte = &JNIEnv::GetStaticByteField;
        static constexpr auto GetChar = &JNIEnv::GetStaticCharField;
        static constexpr auto GetShort = &JNIEnv::GetStaticShortField;
        static constexpr auto GetInt = &JNIEnv::GetStaticIntField;
        static constexpr auto GetLong = &JNIEnv::GetStaticLongField;
        static constexpr auto GetFloat = &JNIEnv::GetStaticFloatField;
        static constexpr auto GetDouble = &JNIEnv::GetStaticDoubleField;
        static constexpr auto GetObject = &JNIEnv::GetStaticObjectField;
        static constexpr auto SetBoolean = &JNIEnv::SetStaticBooleanField;
        static constexpr auto SetByte = &JNIEnv::SetStaticByteField;
        static constexpr auto SetChar = &JNIEnv::SetStaticCharField;
        static constexpr auto SetShort = &JNIEnv::SetStaticShortField;
        static constexpr auto SetInt = &JNIEnv::SetStaticIntField;
        static constexpr auto SetLong = &JNIEnv::SetStaticLongField;
        static constexpr auto SetFloat = &JNIEnv::SetStaticFloatField;
        static constexpr auto SetDouble = &JNIEnv::SetStaticDoubleField;
        static constexpr auto SetObject = &JNIEnv::SetStaticObjectField;
    };

    template<class Target>
    Value Get(ENV & env, Target target, const Field & field) {
        using F = Fields<Target>;
        auto jenv = env.GetJNIEnv();
        switch (field.signature[0]) {
        case 'Z':
            return (bool)(jenv->*F::GetBoolean)(target, field.id);
        case 'B':
            return (jenv->*F::GetByte)(target, field.id);
        case 'C':
            return JCharToUTF((jenv->*F::GetChar)(target, field.id));
        case 'S':
            return (jenv->*F::GetShort)(target, field.id);
        case 'I':
            return (jenv->*F::GetInt)(target, field.id);
        case 'J':
            return (jenv->*F::GetLong)(target, field.id);
        case 'F':
            return (jenv->*F::GetFloat)(target, field.id);
        case 'D':
            return (jenv->*F::GetDouble)(target, field.id);
        default: {
            LocalFrame frame(jenv, 1);
            return env.MakeGlobal((jenv->*F::GetObject)(target, field.id));
        }
        }
    }

    template<class Target>
    void Set(ENV & env, Target target, const Field & field, const Value & value) {
        using F = Fields<Target>;
        auto jenv = env.GetJNIEnv();
        // Same conversion rules as for a single argument
        auto jvalues = ENV::MakeArguments(field.signature, { value });
        auto&& v = jvalues[0];
        switch (field.signature[0]) {
        case 'Z':
            (jenv->*F::SetBoolean)(target, field.id, v.z);
            break;
        case 'B':
            (jenv->*F::SetByte)(target, field.id, v.b);
            break;
        case 'C':
            (jenv->*F::SetChar)(target, field.id, v.c);
            break;
        case 'S':
            (jenv->*F::SetShort)(target, field.id, v.s);
            break;
        case 'I':
            (jenv->*F::SetInt)(target, field.id, v.i);
            break;
        case 'J':
            (jenv->*F::SetLong)(target, field.id, v.j);
            break;
        case 'F':
            (jenv->*F::SetFloat)(target, field.id, v.f);
            break;
        case 'D':
            (jenv->*F::SetDouble)(target, field.id, v.d);
            break;
        default:
            (jenv->*F::SetObject)(target, field.id, v.l);
            break;
        }
    }
}

template<bool isStatic>
Field ENV::LookupField(const Class &cl, const std::string &name, const std::string &signature) {
    if(!IsTypeSignature(signature)) {
        throw JavaError("Bad field signature: " + signature);
    }
    auto id = isStatic ? env->GetStaticFieldID(cl.GetHandle(), name.data(), signature.data())
                       : env->GetFieldID(cl.GetHandle(), name.data(), signature.data());
    ThrowIfPending();
    if(!id) {
        throw JavaError("Could not find field name = \"" + name + "\" with signature = \"" + signature + "\"");
    }
    return Field{ id, name, signature, isStatic };
}

Field ENV::GetFieldID(const Class &cl, const std::string &name, const std::string &signature) {
    return LookupField<false>(cl, name, signature);
}

Field ENV::GetStaticFieldID(const Class &cl, const std::string &name, const std::string &signature) {
    return LookupField<true>(cl, name, signature);
}

Value ENV::GetField(const Object &obj, const Field &field) {
    if(field._static) {
        throw JavaError("GetField called with a static field. Use GetStaticField instead");
    }
    auto result = Get<jobject>(*this, obj.GetHandle(), field);
    ThrowIfPending();
    return result;
}

void ENV::SetField(const Object &obj, const Field &field, const Value &value) {
    if(field._static) {
        throw JavaError("SetField called with a static field. Use SetStaticField instead");
    }
    Set<jobject>(*this, obj.GetHandle(), field, value);
    ThrowIfPending();
}

Value ENV::GetStaticField(const Class &cl, const Field &field) {
    if(!field._static) {
        throw JavaError("GetStaticField called with an object field. Use GetField instead");
    }
    auto result = Get<jclass>(*this, cl.GetHandle(), field);
    ThrowIfPending();
    return result;
}

void ENV::SetStaticField(const Class &cl, const Field &field, const Value &value) {
    if(!field._static) {
        throw JavaError("SetStaticField called with an object field. Use SetField instead");
    }
    Set<jclass>(*this, cl.GetHandle(), field, value);
    ThrowIfPending();
}
