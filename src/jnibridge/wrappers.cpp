#include <jnibridge/wrappers.h>
#include <jnibridge/signature.h>
#include <jnibridge/throwable.h>
#include <jnibridge/util.h>
#include <limits>
#include "internal/string.hpp"
#include "internal/log.h"

using namespace jnibridge;

namespace {
    // java.lang.reflect.Modifier.STATIC
    constexpr jlong STATIC = 8;

    std::string TypeName(const std::string & typeSig) {
        switch (typeSig[0]) {
        case 'Z':
            return "boolean";
        case 'B':
            return "byte";
        case 'C':
            return "char";
        case 'S':
            return "short";
        case 'I':
            return "int";
        case 'J':
            return "long";
        case 'F':
            return "float";
        case 'D':
            return "double";
        case 'L':
            return ToDottedName(ClassNameFromSignature(typeSig));
        default:
            return typeSig;
        }
    }

    template<class T> bool Fits(jlong i) {
        return i >= std::numeric_limits<T>::min() && i <= std::numeric_limits<T>::max();
    }

    // Integer value that fits the primitive type T
    template<class T> Value CastIntegral(const Value & value, const std::string & typeSig) {
        if(value.IsInt() || value.IsBool()) {
            auto i = value.AsInt();
            if(Fits<T>(i)) {
                return i;
            }
        }
        throw TypeError("Failed to convert argument to " + typeSig);
    }

    std::string ClassSignature(ENV & env, const Value & klass) {
        Class cl(klass.AsObject()->GetHandle());
        return Signature(env, cl);
    }

    Overload MakeOverload(ENV & env, std::shared_ptr<Object> member, bool constructor) {
        Overload overload;
        overload.name = constructor ? "<init>" : Call(env, *member, "getName", "()Ljava/lang/String;").AsString();
        auto params = Call(env, *member, "getParameterTypes", "()[Ljava/lang/Class;");
        for(auto&& param : env.GetObjectArrayElements(*params.AsObject())) {
            overload.parameterTypes.push_back(ClassSignature(env, param));
        }
        overload.returnType = constructor ? "V" : ClassSignature(env, Call(env, *member, "getReturnType", "()Ljava/lang/Class;"));
        overload.varArgs = Call(env, *member, "isVarArgs", "()Z").AsBool();
        overload._static = (Call(env, *member, "getModifiers", "()I").AsInt() & STATIC) != 0;
        overload.reflected = std::move(member);
        return overload;
    }

    template<class Map> std::vector<std::string> Keys(const Map & map) {
        std::vector<std::string> keys;
        for(auto&& entry : map) {
            keys.push_back(entry.first);
        }
        return keys;
    }
}

std::string Overload::GetSignature() const {
    std::string signature = "(";
    for(auto&& type : parameterTypes) {
        signature += type;
    }
    return signature + ")" + returnType;
}

std::string jnibridge::Signature(ENV &env, const Class &klass) {
    return klass.GetSignature(env);
}

Value jnibridge::Cast(ENV &env, const Value &value, const std::string &typeSig) {
    if(typeSig.empty()) {
        throw JavaError("Bad signature: empty type");
    }
    if(typeSig == "V") {
        return nullptr;
    }
    bool primitive = IsPrimitiveType(typeSig[0]);
    if(value.IsNull()) {
        if(primitive) {
            throw TypeError("Can't cast None to a primitive type");
        }
        return nullptr;
    }
    if(value.IsObject()) {
        auto&& obj = *value.AsObject();
        if(primitive || !env.IsInstanceOf(obj, *env.FindClass(ClassNameFromSignature(typeSig)))) {
            throw TypeError("Object of class " + env.GetObjectClass(obj)->GetName(env) + " cannot be cast to " + TypeName(typeSig));
        }
        return value;
    }
    if(value.IsSequence()) {
        if(typeSig[0] != '[') {
            throw TypeError("Argument must not be a sequence");
        }
        auto componentType = typeSig.substr(1);
        Value::Sequence elements;
        elements.reserve(value.AsSequence().size());
        for(auto&& element : value.AsSequence()) {
            elements.push_back(Cast(env, element, componentType));
        }
        return GetNiceArg(env, elements, typeSig);
    }
    switch (typeSig[0]) {
    case 'Z':
        if(value.IsBool() || value.IsInt()) {
            return value.AsBool();
        }
        break;
    case 'B':
        return CastIntegral<jbyte>(value, typeSig);
    case 'S':
        return CastIntegral<jshort>(value, typeSig);
    case 'I':
        return CastIntegral<jint>(value, typeSig);
    case 'J':
        return CastIntegral<jlong>(value, typeSig);
    case 'C':
        if(value.IsString()) {
            UTFToJChar(value.AsString());
            return value;
        }
        return CastIntegral<jchar>(value, typeSig);
    case 'F':
    case 'D':
        if(value.IsNumber()) {
            return value.AsDouble();
        }
        break;
    case 'L':
        if(typeSig == "Ljava/lang/String;" || typeSig == "Ljava/lang/CharSequence;") {
            if(value.IsString()) {
                return GetNiceArg(env, value, "Ljava/lang/String;");
            }
        } else if(typeSig == "Ljava/lang/Object;") {
            return Box(env, value);
        }
        break;
    }
    throw TypeError("Failed to convert argument to " + typeSig);
}

Resolution jnibridge::ResolveOverload(ENV &env, const std::string &name, const std::vector<Overload> &overloads, const std::vector<Value> &args) {
    for(auto&& overload : overloads) {
        auto count = overload.parameterTypes.size();
        std::vector<Value> candidate;
        if(overload.varArgs && count > 0) {
            auto fixed = count - 1;
            if(args.size() < fixed) {
                continue;
            }
            candidate.assign(args.begin(), args.begin() + fixed);
            candidate.emplace_back(Value::Sequence(args.begin() + fixed, args.end()));
        } else {
            if(args.size() != count) {
                continue;
            }
            candidate = args;
        }
        std::vector<Value> cast;
        cast.reserve(count);
        try {
            for(size_t i = 0; i < count; i++) {
                cast.push_back(Cast(env, candidate[i], overload.parameterTypes[i]));
            }
        } catch(const TypeError &) {
            continue;
        } catch(const JavaError &) {
            // A parameter type that can't be loaded rules the candidate out
            continue;
        } catch(const JavaException &) {
            continue;
        }
        return Resolution{ &overload, std::move(cast) };
    }
    throw TypeError("No matching method found for " + name);
}

ClassMembers ClassMembers::Reflect(ENV &env, const Class &cl) {
    ClassMembers members;
    auto methods = Call(env, cl, "getMethods", "()[Ljava/lang/reflect/Method;");
    for(auto&& method : env.GetObjectArrayElements(*methods.AsObject())) {
        auto overload = MakeOverload(env, method, false);
        auto name = overload.name;
        (overload._static ? members.staticMethods : members.methods)[name].push_back(std::move(overload));
    }
    auto constructors = Call(env, cl, "getConstructors", "()[Ljava/lang/reflect/Constructor;");
    for(auto&& constructor : env.GetObjectArrayElements(*constructors.AsObject())) {
        members.constructors.push_back(MakeOverload(env, constructor, true));
    }
    auto fields = Call(env, cl, "getFields", "()[Ljava/lang/reflect/Field;");
    for(auto&& field : env.GetObjectArrayElements(*fields.AsObject())) {
        auto name = Call(env, *field, "getName", "()Ljava/lang/String;").AsString();
        auto signature = ClassSignature(env, Call(env, *field, "getType", "()Ljava/lang/Class;"));
        bool isStatic = (Call(env, *field, "getModifiers", "()I").AsInt() & STATIC) != 0;
        members.fields[name] = FieldInfo{ signature, isStatic };
    }
    return members;
}

JWrapper::JWrapper(std::shared_ptr<ENV> env, std::shared_ptr<Object> obj) : env(std::move(env)), obj(std::move(obj)) {
    if(!this->obj) {
        throw JavaError("JWrapper needs a java object");
    }
    klass = this->env->GetObjectClass(*this->obj);
    members = ClassMembers::Reflect(*this->env, *klass);
}

Value JWrapper::Invoke(const std::string &name, const std::vector<Value> &args) {
    auto f = members.methods.find(name);
    if(f == members.methods.end()) {
        throw AttributeError("Could not find method " + name);
    }
    auto resolution = ResolveOverload(*env, name, f->second, args);
    auto&& overload = *resolution.overload;
    auto method = env->FromReflectedMethod(*overload.reflected, overload.GetSignature(), false);
    return GetNiceResult(*env, env->CallMethod(*obj, method, resolution.args), overload.returnType);
}

Value JWrapper::GetField(const std::string &name) {
    auto f = members.fields.find(name);
    if(f == members.fields.end()) {
        throw AttributeError("Could not find field " + name);
    }
    if(f->second._static) {
        throw AttributeError("Field " + name + " is static");
    }
    return jnibridge::GetField(*env, *obj, name, f->second.signature);
}

void JWrapper::SetField(const std::string &name, const Value &value) {
    auto f = members.fields.find(name);
    if(f == members.fields.end()) {
        throw AttributeError("Could not find field " + name);
    }
    if(f->second._static) {
        throw AttributeError("Field " + name + " is static");
    }
    jnibridge::SetField(*env, *obj, name, f->second.signature, Cast(*env, value, f->second.signature));
}

std::vector<std::string> JWrapper::MethodNames() const {
    return Keys(members.methods);
}

std::vector<std::string> JWrapper::FieldNames() const {
    std::vector<std::string> names;
    for(auto&& field : members.fields) {
        if(!field.second._static) {
            names.push_back(field.first);
        }
    }
    return names;
}

std::string JWrapper::ToString() {
    return jnibridge::ToString(*env, *obj);
}

JClassWrapper::JClassWrapper(std::shared_ptr<ENV> env, const std::string &className) : env(std::move(env)) {
    klass = ClassForName(*this->env, className);
    members = ClassMembers::Reflect(*this->env, *klass);
}

Value JClassWrapper::Invoke(const std::string &name, const std::vector<Value> &args) {
    auto f = members.staticMethods.find(name);
    if(f == members.staticMethods.end()) {
        throw AttributeError("Could not find static method " + name);
    }
    auto resolution = ResolveOverload(*env, name, f->second, args);
    auto&& overload = *resolution.overload;
    auto method = env->FromReflectedMethod(*overload.reflected, overload.GetSignature(), true);
    return GetNiceResult(*env, env->CallStaticMethod(*klass, method, resolution.args), overload.returnType);
}

Value JClassWrapper::GetField(const std::string &name) {
    auto f = members.fields.find(name);
    if(f == members.fields.end()) {
        throw AttributeError("Could not find field " + name);
    }
    if(!f->second._static) {
        throw AttributeError("Field " + name + " is not static");
    }
    auto field = env->GetStaticFieldID(*klass, name, f->second.signature);
    return GetNiceResult(*env, env->GetStaticField(*klass, field), f->second.signature);
}

void JClassWrapper::SetField(const std::string &name, const Value &value) {
    auto f = members.fields.find(name);
    if(f == members.fields.end()) {
        throw AttributeError("Could not find field " + name);
    }
    if(!f->second._static) {
        throw AttributeError("Field " + name + " is not static");
    }
    auto field = env->GetStaticFieldID(*klass, name, f->second.signature);
    env->SetStaticField(*klass, field, Cast(*env, value, f->second.signature));
}

std::shared_ptr<Object> JClassWrapper::NewInstance(const std::vector<Value> &args) {
    const Overload * overload = nullptr;
    std::vector<Value> cast;
    try {
        auto resolution = ResolveOverload(*env, "<init>", members.constructors, args);
        overload = resolution.overload;
        cast = std::move(resolution.args);
    } catch(const TypeError &) {
        throw TypeError("No matching constructor found");
    }
    auto constructor = env->FromReflectedMethod(*overload->reflected, overload->GetSignature(), false);
    return env->NewObject(*klass, constructor, cast);
}

std::vector<std::string> JClassWrapper::MethodNames() const {
    return Keys(members.staticMethods);
}

std::vector<std::string> JClassWrapper::FieldNames() const {
    std::vector<std::string> names;
    for(auto&& field : members.fields) {
        if(field.second._static) {
            names.push_back(field.first);
        }
    }
    return names;
}

ScopedEnv::~ScopedEnv() {
    try {
        threads.Exit();
    } catch(const LifecycleError & ex) {
        LOG("JNIBridge", "Leaving a callback failed: %s", ex.what());
    }
}
