#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "env.h"
#include "threadcontext.h"
#include "value.h"

namespace jnibridge {
    // One public method or constructor found by reflection
    struct Overload {
        std::string name;
        // Type signatures of the parameters
        std::vector<std::string> parameterTypes;
        std::string returnType;
        bool varArgs = false;
        bool _static = false;
        // java.lang.reflect.Method or Constructor, may be null
        std::shared_ptr<Object> reflected;

        std::string GetSignature() const;
    };

    struct Resolution {
        const Overload * overload;
        std::vector<Value> args;
    };

    // Converts value for a parameter of type typeSig, throws TypeError
    Value Cast(ENV & env, const Value & value, const std::string & typeSig);
    // Picks the first overload in declaration order whose parameters accept args
    Resolution ResolveOverload(ENV & env, const std::string & name, const std::vector<Overload> & overloads, const std::vector<Value> & args);
    // Type signature of a java.lang.Class
    std::string Signature(ENV & env, const Class & klass);

    // Public methods and fields of a class, split into static and instance members
    struct ClassMembers {
        struct FieldInfo {
            std::string signature;
            bool _static;
        };
        std::map<std::string, std::vector<Overload>> methods;
        std::map<std::string, std::vector<Overload>> staticMethods;
        std::vector<Overload> constructors;
        std::map<std::string, FieldInfo> fields;

        static ClassMembers Reflect(ENV & env, const Class & cl);
    };

    // Dynamic access to the public instance members of a java object
    class JWrapper {
        std::shared_ptr<ENV> env;
        std::shared_ptr<Object> obj;
        std::shared_ptr<Class> klass;
        ClassMembers members;
    public:
        JWrapper(std::shared_ptr<ENV> env, std::shared_ptr<Object> obj);

        const std::shared_ptr<Object> & GetObject() const {
            return obj;
        }
        Value Invoke(const std::string & name, const std::vector<Value> & args = {});
        Value GetField(const std::string & name);
        void SetField(const std::string & name, const Value & value);
        std::vector<std::string> MethodNames() const;
        std::vector<std::string> FieldNames() const;
        std::string ToString();
    };

    // Dynamic access to the static members and constructors of a class
    class JClassWrapper {
        std::shared_ptr<ENV> env;
        std::shared_ptr<Class> klass;
        ClassMembers members;
    public:
        // Dotted or slashed class name
        JClassWrapper(std::shared_ptr<ENV> env, const std::string & className);

        const std::shared_ptr<Class> & GetClass() const {
            return klass;
        }
        Value Invoke(const std::string & name, const std::vector<Value> & args = {});
        Value GetField(const std::string & name);
        void SetField(const std::string & name, const Value & value);
        std::shared_ptr<Object> NewInstance(const std::vector<Value> & args = {});
        std::vector<std::string> MethodNames() const;
        std::vector<std::string> FieldNames() const;
    };

    // Makes the env passed to a native method active while it runs
    class ScopedEnv {
        ThreadRegistry & threads;
    public:
        ScopedEnv(ThreadRegistry & threads, JNIEnv * env) : threads(threads) {
            threads.Enter(env);
        }
        ScopedEnv(const ScopedEnv&) = delete;
        ScopedEnv& operator=(const ScopedEnv&) = delete;
        ~ScopedEnv();
    };
}
