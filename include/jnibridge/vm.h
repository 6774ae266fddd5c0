#ifndef JNIBRIDGE_VM_H_1
#define JNIBRIDGE_VM_H_1
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <jni.h>
#include "env.h"
#include "libraryoptions.h"

namespace jnibridge {
    class Reaper;
    class ThreadRegistry;

    enum class VMState {
        Uninitialized,
        Starting,
        Active,
        ShuttingDown,
        // A killed vm cannot be started again
        Destroyed
    };

    const char * ToString(VMState state);

    struct NativeRegistration {
        // Slashed or dotted class name
        std::string className;
        std::vector<NativeMethod> methods;
    };

    struct VMOptions {
        // Raw jvm options, class path options are not allowed here
        std::vector<std::string> args;
        // Defaults to the entries of CLASSPATH if not set
        std::optional<std::vector<std::string>> classPath;
        // e.g. 512m
        std::string maxHeapSize;
        bool runHeadless = false;
        // Located below JAVA_HOME if empty
        std::string libjvmPath;
        jint version = JNI_VERSION_1_6;
        bool ignoreUnrecognized = false;
        std::vector<NativeRegistration> natives;
        // Runs before the vm goes down, e.g. to close windows
        std::function<void()> shutdownHook;
        LibraryOptions loader;
    };

    // Loaded libjvm
    class JvmLibrary {
        LibraryOptions loptions;
        void * handle;
        jint (*createJavaVM)(JavaVM **, void **, void *);
        // libjvm can't be unloaded once a vm was created
        bool used;
    public:
        JvmLibrary(const std::string & rpath, LibraryOptions loptions);
        JvmLibrary(const JvmLibrary&) = delete;
        JvmLibrary& operator=(const JvmLibrary&) = delete;
        ~JvmLibrary();
        jint CreateJavaVM(JavaVM ** vm, JNIEnv ** env, JavaVMInitArgs * args);
    };

    // Owns the jvm and the thread it was created on
    class VM {
        std::shared_ptr<ThreadRegistry> threads;
        std::shared_ptr<Reaper> reaper;
        std::unique_ptr<JvmLibrary> library;
        std::atomic<VMState> state;
        std::function<void()> shutdownHook;
        // Serializes Start and Kill
        std::mutex lifecycle;
        // Guards everything shared with the monitor thread
        std::mutex mtx;
        std::condition_variable wakeup;
        bool wake = false;
        bool kill = false;
        std::deque<std::function<void()>> closures;
        std::thread monitor;
        std::thread::id monitorId;
        std::future<void> dead;

        void Monitor(VMOptions options, std::vector<std::string> jvmArgs, std::promise<void> started, std::promise<void> died);
        void Enqueue(std::function<void()> closure);
        bool NextClosure(std::function<void()> & closure);
    public:
        VM();
        VM(const VM&) = delete;
        VM& operator=(const VM&) = delete;
        // Kills a running vm
        ~VM();

        // Creates the jvm on a new monitor thread and attaches the calling thread
        void Start(VMOptions options = {});
        // Detaches the calling thread, stops the monitor thread and destroys the jvm
        void Kill();

        VMState GetState() const {
            return state.load();
        }
        bool IsActive() const {
            return GetState() == VMState::Active;
        }
        JavaVM * GetJavaVM() const;
        const std::shared_ptr<ThreadRegistry> & GetThreads() const {
            return threads;
        }
        const std::shared_ptr<Reaper> & GetReaper() const {
            return reaper;
        }

        // Attach and Detach calls of one thread must be balanced
        std::shared_ptr<ENV> Attach();
        void Detach();
        // Returns the Env of the current thread
        std::shared_ptr<ENV> GetEnv();
        // Returns the jni JNIEnv of the current thread or nullptr
        JNIEnv * GetJNIEnv();

        // True on the monitor thread
        bool IsMainThread();
        // Wakes the monitor thread, it reaps dead references and runs queued closures
        void Wake();
        // Runs closure on the monitor thread, inline if already there
        // Exceptions of synchronous closures are rethrown here
        void RunInMainThread(std::function<void()> closure, bool synchronous);
        template<class T> T CallInMainThread(std::function<T()> closure);
    };

    template<class T> T VM::CallInMainThread(std::function<T()> closure) {
        if(IsMainThread()) {
            return closure();
        }
        auto done = std::make_shared<std::promise<T>>();
        auto result = done->get_future();
        Enqueue([closure, done]() {
            try {
                done->set_value(closure());
            } catch(...) {
                done->set_exception(std::current_exception());
            }
        });
        return result.get();
    }
}
#endif
