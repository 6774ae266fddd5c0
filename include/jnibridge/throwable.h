#pragma once
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <jni.h>

namespace jnibridge {
    class Object;

    // Caused by using the bridge incorrectly, e.g. a malformed signature
    class JavaError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Dynamic attribute lookup failed on a wrapper
    class AttributeError : public JavaError {
    public:
        using JavaError::JavaError;
    };

    // No overload matched or a value could not be converted
    class TypeError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // The jvm could not be loaded, created or attached
    class SetupError : public std::runtime_error {
        jint code;
    public:
        SetupError(const std::string & message, jint code = JNI_ERR) : std::runtime_error(message), code(code) {}
        jint GetCode() const {
            return code;
        }
    };

    class JVMNotFoundError : public SetupError {
    public:
        JVMNotFoundError() : SetupError("Can't find the Java Virtual Machine") {}
    };

    // The jvm failed to allocate a string, array or object
    class OutOfMemoryError : public std::bad_alloc {
        std::string message;
    public:
        explicit OutOfMemoryError(std::string message) : message(std::move(message)) {}
        const char * what() const noexcept override {
            return message.data();
        }
    };

    // Broken attach / detach pairing or use of a killed vm
    class LifecycleError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    // A java exception, already cleared from the thread that raised it
    class JavaException : public std::runtime_error {
        std::shared_ptr<Object> throwable;
        std::string className;
        std::string message;
        std::shared_ptr<Object> cause;
    public:
        JavaException(std::shared_ptr<Object> throwable, std::string className, std::string message, std::shared_ptr<Object> cause = nullptr);
        const std::shared_ptr<Object> & GetThrowable() const {
            return throwable;
        }
        const std::string & GetClassName() const {
            return className;
        }
        const std::string & GetMessage() const {
            return message;
        }
        // The throwable that caused this one, nullptr if there is none
        const std::shared_ptr<Object> & GetCause() const {
            return cause;
        }
    };
}
