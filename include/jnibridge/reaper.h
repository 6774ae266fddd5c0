#pragma once
#include "queue.h"
#include <functional>
#include <memory>
#include <mutex>
#include <jni.h>

namespace jnibridge {
    class ThreadRegistry;

    // Releases global references, deferring those dropped by threads without an environment
    class Reaper {
        std::shared_ptr<ThreadRegistry> threads;
        ConcurrentQueue<jobject> dead;
        std::mutex mtx;
        std::function<void()> wake;
        bool closed = false;
    public:
        explicit Reaper(std::shared_ptr<ThreadRegistry> threads);
        // Called whenever a reference was queued
        void SetWakeHandler(std::function<void()> handler);
        void Release(jobject ref);
        // Deletes all queued references if the current thread has an environment
        size_t Reap();
        // Forgets queued references of a destroyed vm
        size_t Discard();
        // The vm is gone, later releases are dropped
        size_t Close();
        bool IsClosed();
        size_t PendingCount() const;
    };
}
