#include <jnibridge/util.h>
#include <jnibridge/signature.h>
#include <jnibridge/throwable.h>
#include <jnibridge/vm.h>
#include <climits>
#include "internal/array.hpp"
#include "internal/string.hpp"
#include "internal/log.h"

using namespace jnibridge;

namespace {
    std::vector<Value> GetNiceArgs(ENV & env, const std::vector<Value> & args, const std::vector<std::string> & argTypes) {
        // A count mismatch is reported by MakeArguments
        std::vector<Value> result;
        result.reserve(args.size());
        for(size_t i = 0; i < args.size(); i++) {
            result.push_back(i < argTypes.size() ? GetNiceArg(env, args[i], argTypes[i]) : args[i]);
        }
        return result;
    }

    std::string MethodNotFound(const std::string & name, const std::string & signature) {
        return "Could not find method name = \"" + name + "\" with signature = \"" + signature + "\"";
    }

    template<class T, class Convert>
    std::shared_ptr<Object> MakePrimitiveArray(ENV & env, const Value::Sequence & seq, Convert convert) {
        std::vector<T> values;
        values.reserve(seq.size());
        for(auto&& v : seq) {
            values.push_back((T)convert(v));
        }
        return env.MakeArray<T>(values);
    }

    jchar ToJChar(const Value & v) {
        return v.IsString() ? UTFToJChar(v.AsString()) : (jchar)v.AsInt();
    }

    std::shared_ptr<Object> MakeObjectArray(ENV & env, const Value::Sequence & seq, const std::string & sig) {
        auto componentType = sig.substr(1);
        std::vector<Value> elements;
        elements.reserve(seq.size());
        for(auto&& v : seq) {
            elements.push_back(GetNiceArg(env, v, componentType));
        }
        auto array = env.MakeObjectArray(ArrayLength(elements.size()), *env.FindClass(ClassNameFromSignature(componentType)));
        for(size_t i = 0; i < elements.size(); i++) {
            auto&& element = elements[i];
            if(element.IsObject()) {
                env.SetObjectArrayElement(*array, (jsize)i, element.AsObject());
            } else if(!element.IsNull()) {
                throw JavaError(element.ToString() + " is not a Java object");
            }
        }
        return array;
    }

    struct Unboxer {
        const char * className;
        const char * method;
        const char * signature;
    };

    const Unboxer unboxers[] = {
        { "java/lang/Integer", "intValue", "()I" },
        { "java/lang/Long", "longValue", "()J" },
        { "java/lang/Short", "shortValue", "()S" },
        { "java/lang/Byte", "byteValue", "()B" },
        { "java/lang/Boolean", "booleanValue", "()Z" },
        { "java/lang/Double", "doubleValue", "()D" },
        { "java/lang/Float", "floatValue", "()F" },
        { "java/lang/Character", "charValue", "()C" },
    };
}

Value jnibridge::Call(ENV &env, const Object &obj, const std::string &name, const std::string &signature, const std::vector<Value> &args) {
    auto sig = ParseMethodSignature(signature);
    auto method = env.GetMethodID(*env.GetObjectClass(obj), name, signature);
    if(!method) {
        throw JavaError(MethodNotFound(name, signature));
    }
    auto result = env.CallMethod(obj, *method, GetNiceArgs(env, args, sig.arguments));
    return GetNiceResult(env, result, sig.returnType);
}

Value jnibridge::StaticCall(ENV &env, const std::string &className, const std::string &name, const std::string &signature, const std::vector<Value> &args) {
    auto sig = ParseMethodSignature(signature);
    auto cl = env.FindClass(className);
    auto method = env.GetStaticMethodID(*cl, name, signature);
    if(!method) {
        throw JavaError(MethodNotFound(name, signature));
    }
    auto result = env.CallStaticMethod(*cl, *method, GetNiceArgs(env, args, sig.arguments));
    return GetNiceResult(env, result, sig.returnType);
}

Value jnibridge::GetField(ENV &env, const Object &obj, const std::string &name, const std::string &signature) {
    auto field = env.GetFieldID(*env.GetObjectClass(obj), name, signature);
    return GetNiceResult(env, env.GetField(obj, field), signature);
}

void jnibridge::SetField(ENV &env, const Object &obj, const std::string &name, const std::string &signature, const Value &value) {
    auto field = env.GetFieldID(*env.GetObjectClass(obj), name, signature);
    env.SetField(obj, field, GetNiceArg(env, value, signature));
}

Value jnibridge::GetStaticField(ENV &env, const std::string &className, const std::string &name, const std::string &signature) {
    auto cl = env.FindClass(className);
    auto field = env.GetStaticFieldID(*cl, name, signature);
    return GetNiceResult(env, env.GetStaticField(*cl, field), signature);
}

void jnibridge::SetStaticField(ENV &env, const std::string &className, const std::string &name, const std::string &signature, const Value &value) {
    auto cl = env.FindClass(className);
    auto field = env.GetStaticFieldID(*cl, name, signature);
    env.SetStaticField(*cl, field, GetNiceArg(env, value, signature));
}

std::shared_ptr<Object> jnibridge::MakeInstance(ENV &env, const std::string &className, const std::string &signature, const std::vector<Value> &args) {
    auto sig = ParseMethodSignature(signature);
    auto cl = env.FindClass(className);
    auto constructor = env.GetMethodID(*cl, "<init>", signature);
    if(!constructor) {
        throw JavaError(MethodNotFound("<init>", signature));
    }
    return env.NewObject(*cl, *constructor, GetNiceArgs(env, args, sig.arguments));
}

bool jnibridge::IsInstanceOf(ENV &env, const Value &value, const std::string &className) {
    if(!value.IsObject()) {
        return false;
    }
    return env.IsInstanceOf(*value.AsObject(), *env.FindClass(className));
}

std::string jnibridge::ToString(ENV &env, const Object &obj) {
    auto result = Call(env, obj, "toString", "()Ljava/lang/String;");
    return result.IsNull() ? "null" : result.AsString();
}

std::shared_ptr<Class> jnibridge::ClassForName(ENV &env, const std::string &className) {
    auto result = StaticCall(env, "java/lang/Class", "forName", "(Ljava/lang/String;ZLjava/lang/ClassLoader;)Ljava/lang/Class;", { ToDottedName(className), true, GetClassLoader(env) });
    return env.MakeGlobalClass((jclass)result.AsObject()->GetHandle());
}

std::shared_ptr<Object> jnibridge::Box(ENV &env, const Value &value) {
    if(value.IsNull()) {
        return nullptr;
    }
    if(value.IsObject()) {
        return value.AsObject();
    }
    if(value.IsBool()) {
        return MakeInstance(env, "java/lang/Boolean", "(Z)V", { value });
    }
    if(value.IsInt()) {
        auto i = value.AsInt();
        if(i >= INT_MIN && i <= INT_MAX) {
            return MakeInstance(env, "java/lang/Integer", "(I)V", { value });
        }
        return MakeInstance(env, "java/lang/Long", "(J)V", { value });
    }
    if(value.IsDouble()) {
        return MakeInstance(env, "java/lang/Double", "(D)V", { value });
    }
    if(value.IsString()) {
        return env.NewString(value.AsString());
    }
    return GetNiceArg(env, value, "[Ljava/lang/Object;").AsObject();
}

Value jnibridge::GetNiceArg(ENV &env, const Value &arg, const std::string &sig) {
    if(arg.IsNull() || arg.IsObject() || sig.empty() || IsPrimitiveType(sig[0])) {
        // Primitives are converted while packing the arguments
        return arg;
    }
    bool integral = arg.IsInt() || arg.IsBool();
    if(sig == "Ljava/lang/Integer;" && integral) {
        return MakeInstance(env, "java/lang/Integer", "(I)V", { arg.AsInt() });
    }
    if(sig == "Ljava/lang/Long;" && integral) {
        return MakeInstance(env, "java/lang/Long", "(J)V", { arg.AsInt() });
    }
    if(sig == "Ljava/lang/Boolean;" && integral) {
        return MakeInstance(env, "java/lang/Boolean", "(Z)V", { arg.AsBool() });
    }
    if(sig == "Ljava/lang/Object;" && arg.IsScalar()) {
        return Box(env, arg);
    }
    if((sig == "Ljava/lang/String;" || sig == "Ljava/lang/CharSequence;") && arg.IsString()) {
        return env.NewString(arg.AsString());
    }
    if(sig[0] == '[' && sig.length() > 1 && arg.IsSequence()) {
        auto&& seq = arg.AsSequence();
        switch (sig[1]) {
        case 'Z':
            return MakePrimitiveArray<jboolean>(env, seq, [](const Value & v) { return v.AsBool(); });
        case 'B':
            return MakePrimitiveArray<jbyte>(env, seq, [](const Value & v) { return v.AsInt(); });
        case 'C':
            return MakePrimitiveArray<jchar>(env, seq, ToJChar);
        case 'S':
            return MakePrimitiveArray<jshort>(env, seq, [](const Value & v) { return v.AsInt(); });
        case 'I':
            return MakePrimitiveArray<jint>(env, seq, [](const Value & v) { return v.AsInt(); });
        case 'J':
            return MakePrimitiveArray<jlong>(env, seq, [](const Value & v) { return v.AsInt(); });
        case 'F':
            return MakePrimitiveArray<jfloat>(env, seq, [](const Value & v) { return v.AsDouble(); });
        case 'D':
            return MakePrimitiveArray<jdouble>(env, seq, [](const Value & v) { return v.AsDouble(); });
        default:
            return MakeObjectArray(env, seq, sig);
        }
    }
    if(sig[0] == 'L' && sig.back() == ';') {
        // Try a constructor taking the plain value
        auto className = sig.substr(1, sig.length() - 2);
        if(integral) {
            return MakeInstance(env, className, "(I)V", { arg.AsInt() });
        }
        if(arg.IsString()) {
            return MakeInstance(env, className, "(Ljava/lang/String;)V", { arg });
        }
    }
    return arg;
}

Value jnibridge::GetNiceResult(ENV &env, const Value &result, const std::string &sig) {
    if(!result.IsObject()) {
        return result;
    }
    auto&& obj = *result.AsObject();
    bool anyObject = sig == "Ljava/lang/Object;";
    if(sig == "Ljava/lang/String;" || ((anyObject || sig == "Ljava/lang/CharSequence;") && IsInstanceOf(env, result, "java/lang/String"))) {
        return env.GetString(obj);
    }
    for(auto&& unboxer : unboxers) {
        if(sig == std::string("L") + unboxer.className + ";" || (anyObject && IsInstanceOf(env, result, unboxer.className))) {
            return Call(env, obj, unboxer.method, unboxer.signature);
        }
    }
    return result;
}

std::shared_ptr<Object> jnibridge::GetClassLoader(ENV &env) {
    auto thread = StaticCall(env, "java/lang/Thread", "currentThread", "()Ljava/lang/Thread;");
    auto loader = Call(env, *thread.AsObject(), "getContextClassLoader", "()Ljava/lang/ClassLoader;");
    if(loader.IsNull()) {
        loader = StaticCall(env, "java/lang/ClassLoader", "getSystemClassLoader", "()Ljava/lang/ClassLoader;");
    }
    return loader.IsNull() ? nullptr : loader.AsObject();
}

void jnibridge::InitContextClassLoader(ENV &env) {
    auto thread = StaticCall(env, "java/lang/Thread", "currentThread", "()Ljava/lang/Thread;");
    auto loader = Call(env, *thread.AsObject(), "getContextClassLoader", "()Ljava/lang/ClassLoader;");
    if(!loader.IsNull()) {
        return;
    }
    auto system = StaticCall(env, "java/lang/ClassLoader", "getSystemClassLoader", "()Ljava/lang/ClassLoader;");
    Call(env, *thread.AsObject(), "setContextClassLoader", "(Ljava/lang/ClassLoader;)V", { system });
}

void jnibridge::ExecuteRunnableInMainThread(VM &vm, const std::shared_ptr<Object> &runnable, bool synchronous) {
    if(!runnable) {
        throw JavaError("ExecuteRunnableInMainThread called with a null runnable");
    }
    auto pvm = &vm;
    vm.RunInMainThread([pvm, runnable]() {
        auto env = pvm->GetEnv();
        Call(*env, *runnable, "run", "()V");
    }, synchronous);
}

Value jnibridge::ExecuteCallableInMainThread(VM &vm, const std::shared_ptr<Object> &callable, bool synchronous) {
    if(!callable) {
        throw JavaError("ExecuteCallableInMainThread called with a null callable");
    }
    auto env = vm.GetEnv();
    auto future = MakeInstance(*env, "java/util/concurrent/FutureTask", "(Ljava/util/concurrent/Callable;)V", { callable });
    ExecuteRunnableInMainThread(vm, future, synchronous);
    if(!synchronous) {
        return future;
    }
    return Call(*env, *future, "get", "()Ljava/lang/Object;");
}

void jnibridge::IterateCollection(ENV &env, const Object &collection, const std::function<void(const Value &)> &callback) {
    auto iterator = Call(env, collection, "iterator", "()Ljava/util/Iterator;");
    auto&& it = *iterator.AsObject();
    while(Call(env, it, "hasNext", "()Z").AsBool()) {
        callback(Call(env, it, "next", "()Ljava/lang/Object;"));
    }
}

std::vector<Value> jnibridge::CollectionToVector(ENV &env, const Object &collection) {
    std::vector<Value> result;
    IterateCollection(env, collection, [&result](const Value & v) {
        result.push_back(v);
    });
    return result;
}

Value jnibridge::MapGet(ENV &env, const Object &map, const Value &key) {
    return Call(env, map, "get", "(Ljava/lang/Object;)Ljava/lang/Object;", { key });
}

void jnibridge::MapPut(ENV &env, const Object &map, const Value &key, const Value &value) {
    Call(env, map, "put", "(Ljava/lang/Object;Ljava/lang/Object;)Ljava/lang/Object;", { key, value });
}

std::vector<Value> jnibridge::MapKeys(ENV &env, const Object &map) {
    auto keys = Call(env, map, "keySet", "()Ljava/util/Set;");
    return CollectionToVector(env, *keys.AsObject());
}

std::shared_ptr<Object> jnibridge::MakeList(ENV &env, const std::vector<Value> &values) {
    auto list = MakeInstance(env, "java/util/ArrayList", "()V");
    for(auto&& v : values) {
        Call(env, *list, "add", "(Ljava/lang/Object;)Z", { v });
    }
    return list;
}

std::shared_ptr<Object> jnibridge::MakeMap(ENV &env, const std::vector<std::pair<Value, Value>> &entries) {
    auto map = MakeInstance(env, "java/util/HashMap", "()V");
    for(auto&& entry : entries) {
        MapPut(env, *map, entry.first, entry.second);
    }
    return map;
}

namespace {
    std::string StringOf(ENV & env, const std::shared_ptr<Object> & obj) {
        return obj ? ToString(env, *obj) : "null";
    }

    void ForEachElement(ENV & env, const Object & enumeration, const std::function<void(const std::shared_ptr<Object> &)> & callback) {
        auto cl = env.FindClass("java/util/Enumeration");
        if(!env.IsInstanceOf(enumeration, *cl)) {
            throw JavaError("Object does not implement java.util.Enumeration");
        }
        auto hasMoreElements = env.GetMethodID(*cl, "hasMoreElements", "()Z");
        auto nextElement = env.GetMethodID(*cl, "nextElement", "()Ljava/lang/Object;");
        if(!hasMoreElements || !nextElement) {
            throw JavaError("Failed to look up the methods of java.util.Enumeration");
        }
        while(env.CallMethod(enumeration, *hasMoreElements).AsBool()) {
            auto element = env.CallMethod(enumeration, *nextElement);
            callback(element.IsNull() ? nullptr : element.AsObject());
        }
    }
}

void jnibridge::IterateEnumeration(ENV &env, const Object &enumeration, const std::function<void(const Value &)> &callback) {
    ForEachElement(env, enumeration, [&](const std::shared_ptr<Object> & element) {
        callback(GetNiceResult(env, element, "Ljava/lang/Object;"));
    });
}

std::vector<std::string> jnibridge::EnumerationToStrings(ENV &env, const Object &enumeration) {
    std::vector<std::string> result;
    ForEachElement(env, enumeration, [&](const std::shared_ptr<Object> & element) {
        result.push_back(StringOf(env, element));
    });
    return result;
}

std::map<std::string, std::string> jnibridge::DictionaryToStringMap(ENV &env, const Object &dictionary) {
    auto cl = env.FindClass("java/util/Dictionary");
    if(!env.IsInstanceOf(dictionary, *cl)) {
        throw JavaError("Object does not extend java.util.Dictionary");
    }
    auto get = env.GetMethodID(*cl, "get", "(Ljava/lang/Object;)Ljava/lang/Object;");
    if(!get) {
        throw JavaError("Failed to look up java.util.Dictionary.get");
    }
    auto keys = Call(env, dictionary, "keys", "()Ljava/util/Enumeration;");
    std::map<std::string, std::string> result;
    ForEachElement(env, *keys.AsObject(), [&](const std::shared_ptr<Object> & key) {
        auto value = env.CallMethod(dictionary, *get, { key });
        result[StringOf(env, key)] = StringOf(env, value.IsNull() ? nullptr : value.AsObject());
    });
    return result;
}

std::vector<ThreadStackTrace> jnibridge::GetAllStackTraces(ENV &env) {
    auto traces = StaticCall(env, "java/lang/Thread", "getAllStackTraces", "()Ljava/util/Map;");
    auto entries = Call(env, *traces.AsObject(), "entrySet", "()Ljava/util/Set;");
    std::vector<ThreadStackTrace> result;
    IterateCollection(env, *entries.AsObject(), [&](const Value & entry) {
        ThreadStackTrace trace;
        auto thread = Call(env, *entry.AsObject(), "getKey", "()Ljava/lang/Object;");
        trace.threadName = Call(env, *thread.AsObject(), "getName", "()Ljava/lang/String;").AsString();
        auto frames = Call(env, *entry.AsObject(), "getValue", "()Ljava/lang/Object;");
        for(auto&& frame : env.GetObjectArrayElements(*frames.AsObject())) {
            trace.frames.push_back(StringOf(env, frame));
        }
        result.push_back(std::move(trace));
    });
    return result;
}

void jnibridge::PrintAllStackTraces(ENV &env) {
    for(auto&& trace : GetAllStackTraces(env)) {
        LOG("JNIBridge", "Thread \"%s\"", trace.threadName.data());
        for(auto&& frame : trace.frames) {
            LOG("JNIBridge", "    at %s", frame.data());
        }
    }
}
