#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "env.h"
#include "value.h"

namespace jnibridge {
    class VM;

    // Signature based helpers, arguments pass through GetNiceArg and results through GetNiceResult

    Value Call(ENV & env, const Object & obj, const std::string & name, const std::string & signature, const std::vector<Value> & args = {});
    Value StaticCall(ENV & env, const std::string & className, const std::string & name, const std::string & signature, const std::vector<Value> & args = {});
    Value GetField(ENV & env, const Object & obj, const std::string & name, const std::string & signature);
    void SetField(ENV & env, const Object & obj, const std::string & name, const std::string & signature, const Value & value);
    Value GetStaticField(ENV & env, const std::string & className, const std::string & name, const std::string & signature);
    void SetStaticField(ENV & env, const std::string & className, const std::string & name, const std::string & signature, const Value & value);
    // signature is the constructor signature, e.g. (I)V
    std::shared_ptr<Object> MakeInstance(ENV & env, const std::string & className, const std::string & signature, const std::vector<Value> & args = {});

    // False for anything but a java object
    bool IsInstanceOf(ENV & env, const Value & value, const std::string & className);
    // Object.toString
    std::string ToString(ENV & env, const Object & obj);
    // Class.forName using the context class loader of the current thread
    std::shared_ptr<Class> ClassForName(ENV & env, const std::string & className);
    // Boxes bool, int, double and text, sequences become Object[]
    std::shared_ptr<Object> Box(ENV & env, const Value & value);

    // Best effort conversion of a host value to what the type signature sig expects
    Value GetNiceArg(ENV & env, const Value & arg, const std::string & sig);
    // Unboxes strings and java.lang wrappers of primitive types
    Value GetNiceResult(ENV & env, const Value & result, const std::string & sig);

    // Context class loader of the current thread
    std::shared_ptr<Object> GetClassLoader(ENV & env);
    // Threads attached from native code have no context class loader, use the system one
    void InitContextClassLoader(ENV & env);

    // Runs a java.lang.Runnable on the main thread
    void ExecuteRunnableInMainThread(VM & vm, const std::shared_ptr<Object> & runnable, bool synchronous);
    // Runs a java.util.concurrent.Callable on the main thread
    // Returns its result if synchronous, otherwise the FutureTask running it
    Value ExecuteCallableInMainThread(VM & vm, const std::shared_ptr<Object> & callable, bool synchronous);

    void IterateCollection(ENV & env, const Object & collection, const std::function<void(const Value &)> & callback);
    std::vector<Value> CollectionToVector(ENV & env, const Object & collection);
    Value MapGet(ENV & env, const Object & map, const Value & key);
    void MapPut(ENV & env, const Object & map, const Value & key, const Value & value);
    std::vector<Value> MapKeys(ENV & env, const Object & map);
    // java.util.ArrayList of the boxed values
    std::shared_ptr<Object> MakeList(ENV & env, const std::vector<Value> & values);
    // java.util.HashMap of the boxed entries
    std::shared_ptr<Object> MakeMap(ENV & env, const std::vector<std::pair<Value, Value>> & entries);

    // Elements pass through GetNiceResult, throws JavaError for anything but a java.util.Enumeration
    void IterateEnumeration(ENV & env, const Object & enumeration, const std::function<void(const Value &)> & callback);
    // toString of every element
    std::vector<std::string> EnumerationToStrings(ENV & env, const Object & enumeration);
    // toString of every key and value of a java.util.Dictionary, e.g. a Hashtable or Properties
    std::map<std::string, std::string> DictionaryToStringMap(ENV & env, const Object & dictionary);

    struct ThreadStackTrace {
        std::string threadName;
        // StackTraceElement.toString, innermost first
        std::vector<std::string> frames;
    };
    std::vector<ThreadStackTrace> GetAllStackTraces(ENV & env);
    // Logs the stack of every live java thread
    void PrintAllStackTraces(ENV & env);
}
