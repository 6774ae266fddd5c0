#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <jni.h>
#include "env.h"
#include "value.h"

namespace jnibridge {
    class VM;

    // A java.lang.reflect.Proxy implementing one interface with host handlers
    // Needs org.jnibridge.ProxyHandler on the class path
    class JProxy {
    public:
        // Receives the unboxed arguments, the result is cast to the return type of the method
        using Handler = std::function<Value(ENV & env, const std::vector<Value> & args)>;
        struct Target;
    private:
        std::shared_ptr<Target> target;
        jlong refId;
        std::shared_ptr<Object> obj;
    public:
        // Handlers are looked up by method name, toString, hashCode and equals have defaults
        JProxy(VM & vm, const std::string & interfaceName, std::map<std::string, Handler> handlers);
        JProxy(const JProxy&) = delete;
        JProxy& operator=(const JProxy&) = delete;
        // Later calls from java throw java.lang.Error
        ~JProxy();

        const std::shared_ptr<Object> & GetObject() const {
            return obj;
        }
        jlong GetRefId() const {
            return refId;
        }
    };
}
