#include <jnibridge/proxy.h>
#include <jnibridge/refregistry.h>
#include <jnibridge/signature.h>
#include <jnibridge/threadcontext.h>
#include <jnibridge/throwable.h>
#include <jnibridge/util.h>
#include <jnibridge/vm.h>
#include <jnibridge/wrappers.h>
#include <mutex>
#include "internal/log.h"

using namespace jnibridge;

struct JProxy::Target {
    std::shared_ptr<ThreadRegistry> threads;
    std::shared_ptr<Reaper> reaper;
    std::string interfaceName;
    std::map<std::string, Handler> handlers;
};

namespace {
    const char handlerClassName[] = "org.jnibridge.ProxyHandler";

    struct Boxing {
        char type;
        const char * className;
    };

    const Boxing boxings[] = {
        { 'Z', "java/lang/Boolean" },
        { 'B', "java/lang/Byte" },
        { 'C', "java/lang/Character" },
        { 'S', "java/lang/Short" },
        { 'I', "java/lang/Integer" },
        { 'J', "java/lang/Long" },
        { 'F', "java/lang/Float" },
        { 'D', "java/lang/Double" },
    };

    // InvocationHandler.invoke returns primitives boxed in their own wrapper class
    std::shared_ptr<Object> ToResult(ENV & env, const Value & result, const std::string & sig) {
        if(sig == "V") {
            return nullptr;
        }
        auto cast = Cast(env, result, sig);
        if(!IsPrimitiveType(sig[0])) {
            return cast.IsNull() ? nullptr : cast.AsObject();
        }
        for(auto&& boxing : boxings) {
            if(boxing.type != sig[0]) {
                continue;
            }
            auto cl = env.FindClass(boxing.className);
            auto valueOf = env.GetStaticMethodID(*cl, "valueOf", "(" + sig + ")L" + boxing.className + ";");
            if(!valueOf) {
                throw JavaError(std::string(boxing.className) + " has no valueOf method");
            }
            return env.CallStaticMethod(*cl, *valueOf, { cast }).AsObject();
        }
        throw TypeError("Cannot return a value of type " + sig);
    }

    jobject Dispatch(ENV & env, JProxy::Target & target, jobject proxy, jobject method, jobjectArray jargs) {
        Object reflected(method);
        auto name = Call(env, reflected, "getName", "()Ljava/lang/String;").AsString();
        auto returnType = Call(env, reflected, "getReturnType", "()Ljava/lang/Class;");
        auto sig = Class(returnType.AsObject()->GetHandle()).GetSignature(env);
        std::vector<Value> args;
        if(jargs) {
            for(auto&& element : env.GetObjectArrayElements(Object(jargs))) {
                args.push_back(GetNiceResult(env, element, "Ljava/lang/Object;"));
            }
        }

        Value result;
        auto handler = target.handlers.find(name);
        if(handler != target.handlers.end()) {
            result = handler->second(env, args);
        } else if(name == "toString" && args.empty()) {
            result = "Proxy of " + target.interfaceName;
        } else if(name == "hashCode" && args.empty()) {
            result = (jint)std::hash<const void *>()(&target);
        } else if(name == "equals" && args.size() == 1) {
            result = args[0].IsObject() && env.IsSameObject(Object(proxy), *args[0].AsObject());
        } else {
            throw AttributeError(target.interfaceName + " proxy has no handler for " + name);
        }
        auto value = ToResult(env, result, sig);
        return value ? env.GetJNIEnv()->NewLocalRef(value->GetHandle()) : nullptr;
    }

    void ThrowError(JNIEnv * jenv, const std::string & message) {
        if(jenv->ExceptionCheck()) {
            return;
        }
        auto cl = jenv->FindClass("java/lang/Error");
        if(!cl || jenv->ThrowNew(cl, message.data()) != JNI_OK) {
            LOG("JNIBridge", "Failed to throw java.lang.Error: %s", message.data());
        }
    }

    jobject JNICALL InvokeHandler(JNIEnv * jenv, jclass, jlong id, jobject proxy, jobject method, jobjectArray args) {
        try {
            auto target = RefRegistry::Instance().Redeem<JProxy::Target>(id);
            ScopedEnv scope(*target->threads, jenv);
            ENV env(jenv, target->reaper);
            try {
                return Dispatch(env, *target, proxy, method, args);
            } catch(const JavaException & ex) {
                if(!ex.GetThrowable()) {
                    throw;
                }
                // The java caller gets the original throwable
                env.Throw(*ex.GetThrowable());
            }
        } catch(const std::exception & ex) {
            LOG("JNIBridge", "Proxy handler failed: %s", ex.what());
            ThrowError(jenv, std::string("Host exception: ") + ex.what());
        } catch(...) {
            LOG("JNIBridge", "Proxy handler failed with an unknown exception");
            ThrowError(jenv, "Host exception");
        }
        return nullptr;
    }

    std::mutex registration;
    JavaVM * registeredFor = nullptr;

    void RegisterHandler(VM & vm, ENV & env, const Class & handlerClass) {
        std::lock_guard<std::mutex> lock(registration);
        auto javaVM = vm.GetJavaVM();
        if(registeredFor == javaVM) {
            return;
        }
        env.RegisterNatives(handlerClass, { { "invoke", "(JLjava/lang/Object;Ljava/lang/reflect/Method;[Ljava/lang/Object;)Ljava/lang/Object;", (void *)&InvokeHandler } });
        registeredFor = javaVM;
    }
}

JProxy::JProxy(VM &vm, const std::string &interfaceName, std::map<std::string, Handler> handlers) : target(std::make_shared<Target>()), refId(0) {
    target->threads = vm.GetThreads();
    target->reaper = vm.GetReaper();
    target->interfaceName = ToDottedName(interfaceName);
    target->handlers = std::move(handlers);
    auto env = vm.GetEnv();
    auto handlerClass = ClassForName(*env, handlerClassName);
    RegisterHandler(vm, *env, *handlerClass);
    auto iface = ClassForName(*env, interfaceName);
    auto newProxy = env->GetStaticMethodID(*handlerClass, "newProxy", "(Ljava/lang/Class;J)Ljava/lang/Object;");
    if(!newProxy) {
        throw JavaError(std::string(handlerClassName) + " has no newProxy method");
    }
    refId = RefRegistry::Instance().Create(target);
    try {
        obj = env->CallStaticMethod(*handlerClass, *newProxy, { iface, refId }).AsObject();
    } catch(...) {
        RefRegistry::Instance().Remove(refId);
        throw;
    }
}

JProxy::~JProxy() {
    RefRegistry::Instance().Remove(refId);
}
