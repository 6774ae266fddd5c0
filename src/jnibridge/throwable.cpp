#include <jnibridge/throwable.h>
#include <jnibridge/object.h>

using namespace jnibridge;

static std::string Describe(const std::string & className, const std::string & message) {
    if(className.empty()) {
        return message.empty() ? "Java exception" : message;
    }
    return message.empty() ? className : className + ": " + message;
}

JavaException::JavaException(std::shared_ptr<Object> throwable, std::string className, std::string message, std::shared_ptr<Object> cause) : std::runtime_error(Describe(className, message)), throwable(std::move(throwable)), className(std::move(className)), message(std::move(message)), cause(std::move(cause)) {
}
