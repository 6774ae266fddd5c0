#ifndef JNIBRIDGE_ENV_H_1
#define JNIBRIDGE_ENV_H_1
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <jni.h>
#include "method.h"
#include "object.h"
#include "value.h"

namespace jnibridge {
    class Reaper;

    // Pushes a local frame, pops it again when leaving the scope
    class LocalFrame {
        JNIEnv * env;
        bool active;
    public:
        LocalFrame(JNIEnv * env, jint capacity = 16);
        LocalFrame(const LocalFrame&) = delete;
        LocalFrame& operator=(const LocalFrame&) = delete;
        ~LocalFrame();
        // Drops every local reference created since the last push
        void Reset(jint capacity);
    };

    // Holds the monitor of a java object
    class MonitorLock {
        JNIEnv * env;
        jobject obj;
    public:
        MonitorLock(JNIEnv * env, jobject obj);
        MonitorLock(const MonitorLock&) = delete;
        MonitorLock& operator=(const MonitorLock&) = delete;
        ~MonitorLock();
    };

    struct PendingException {
        std::shared_ptr<Object> throwable;
        std::string className;
        std::string message;
        // getCause() of the throwable, may be nullptr
        std::shared_ptr<Object> cause;
    };

    struct NativeMethod {
        std::string name;
        std::string signature;
        void * fnPtr;
    };

    // Typed access to the environment of one thread
    class ENV {
        JNIEnv * env;
        std::shared_ptr<Reaper> reaper;

        template<bool isStatic>
        std::shared_ptr<Method> LookupMethod(const Class & cl, const std::string & name, const std::string & signature);
        template<bool isStatic>
        Field LookupField(const Class & cl, const std::string & name, const std::string & signature);
        std::string DescribeThrowable(jthrowable throwable, std::string & className);
        std::shared_ptr<Object> GetCause(jthrowable throwable);
    public:
        ENV(JNIEnv * env, std::shared_ptr<Reaper> reaper);

        JNIEnv * GetJNIEnv() const {
            return env;
        }
        const std::shared_ptr<Reaper> & GetReaper() const {
            return reaper;
        }
        // Major and minor jni version
        std::pair<int, int> GetVersion();

        // Promotes ref to an owned global reference, nullptr stays nullptr
        std::shared_ptr<Object> MakeGlobal(jobject ref);
        std::shared_ptr<Class> MakeGlobalClass(jclass ref);
        // Same as MakeGlobal, but deletes the local reference afterwards
        std::shared_ptr<Object> MakeObject(jobject local);
        std::shared_ptr<Class> MakeClass(jclass local);

        // Accepts java.lang.String as well as java/lang/String
        std::shared_ptr<Class> FindClass(const std::string & name);
        std::shared_ptr<Class> GetObjectClass(const Object & obj);
        bool IsInstanceOf(const Object & obj, const Class & cl);
        bool IsSameObject(const Object & a, const Object & b);

        bool ExceptionCheck();
        // Takes the pending java exception, nothing is pending afterwards
        std::optional<PendingException> TakePendingException();
        // Throws the pending java exception as JavaException
        void ThrowIfPending();
        void Throw(const Object & throwable);
        void ThrowNew(const Class & cl, const std::string & message);

        // Return nullptr if there is no such method
        std::shared_ptr<Method> GetMethodID(const Class & cl, const std::string & name, const std::string & signature);
        std::shared_ptr<Method> GetStaticMethodID(const Class & cl, const std::string & name, const std::string & signature);
        Method FromReflectedMethod(const Object & method, const std::string & signature, bool isStatic);
        Field GetFieldID(const Class & cl, const std::string & name, const std::string & signature);
        Field GetStaticFieldID(const Class & cl, const std::string & name, const std::string & signature);

        Value CallMethod(const Object & obj, const Method & method, const std::vector<Value> & args = {});
        Value CallStaticMethod(const Class & cl, const Method & method, const std::vector<Value> & args = {});
        std::shared_ptr<Object> NewObject(const Class & cl, const Method & constructor, const std::vector<Value> & args = {});

        Value GetField(const Object & obj, const Field & field);
        void SetField(const Object & obj, const Field & field, const Value & value);
        Value GetStaticField(const Class & cl, const Field & field);
        void SetStaticField(const Class & cl, const Field & field, const Value & value);

        std::shared_ptr<Object> NewString(const std::u16string & str);
        // Converts utf-8 to a java string via utf-16
        std::shared_ptr<Object> NewString(const std::string & str);
        std::shared_ptr<Object> NewStringUTF(const std::string & str);
        // Contents as utf-8
        std::string GetString(const Object & str);
        // Contents as modified utf-8
        std::string GetStringUTF(const Object & str);
        jsize GetStringLength(const Object & str);

        jsize GetArrayLength(const Object & array);
        // T is one of the jni primitive types
        template<class T> std::shared_ptr<Object> MakeArray(const std::vector<T> & values);
        template<class T> std::vector<T> GetArrayElements(const Object & array);
        std::shared_ptr<Object> MakeObjectArray(jsize length, const Class & cl);
        std::vector<std::shared_ptr<Object>> GetObjectArrayElements(const Object & array);
        std::shared_ptr<Object> GetObjectArrayElement(const Object & array, jsize index);
        void SetObjectArrayElement(const Object & array, jsize index, const std::shared_ptr<Object> & value);

        void RegisterNatives(const Class & cl, const std::vector<NativeMethod> & methods);

        // Packs args according to the argument part of a method signature
        static std::vector<jvalue> MakeArguments(const std::string & argSignature, const std::vector<Value> & args);
    };
}
#endif
