#pragma once
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>
#include <jni.h>

namespace jnibridge {
    // Per thread view of the vm
    struct ThreadContext {
        // Currently active environment or nullptr
        JNIEnv* env = nullptr;
        int attachCount = 0;
        // Environments active before Enter
        std::vector<JNIEnv*> envStack;
        // Attached by the vm itself, never detached here
        bool bound = false;
        // AttachCurrentThread was called for this thread
        bool attached = false;
    };

    class ThreadRegistry {
        mutable std::mutex mtx;
        JavaVM* javaVM = nullptr;
        std::unordered_map<std::thread::id, ThreadContext> contexts;
        std::function<void(JNIEnv*)> attachHook;

        ThreadContext& Current();
        ThreadContext* Find() const;
        void Erase();
        // Detaches from the vm once nothing holds the thread anymore
        void Release(ThreadContext& ctx);
    public:
        // Makes the vm available for Attach, env belongs to the calling thread
        void Bind(JavaVM* vm, JNIEnv* env);
        // Drops the calling thread's binding and the vm
        void Unbind();
        JavaVM* GetJavaVM() const;
        // Runs after a thread got attached, e.g. to set its context class loader
        void SetAttachHook(std::function<void(JNIEnv*)> hook);

        JNIEnv* Attach();
        void Detach();
        // Detaches the calling thread until its attach count is zero
        void DetachAll();
        int AttachCount() const;

        // Makes env active for a callback from java
        // Attach and Detach inside the callback only count, the thread stays attached
        void Enter(JNIEnv* env);
        // Restores the environment active before Enter
        void Exit();

        // Environment of the calling thread or nullptr
        JNIEnv* GetEnv() const;
    };
}
