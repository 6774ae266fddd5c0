#include <jnibridge/reaper.h>
#include <jnibridge/threadcontext.h>
#include "internal/log.h"

using namespace jnibridge;

Reaper::Reaper(std::shared_ptr<ThreadRegistry> threads) : threads(std::move(threads)) {
}

void Reaper::SetWakeHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(mtx);
    wake = std::move(handler);
}

void Reaper::Release(jobject ref) {
    if(!ref) {
        return;
    }
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if(closed) {
            return;
        }
        if(auto env = threads->GetEnv()) {
            env->DeleteGlobalRef(ref);
            return;
        }
        dead.Push(ref);
        handler = wake;
    }
    if(handler) {
        handler();
    }
}

size_t Reaper::Reap() {
    auto env = threads->GetEnv();
    if(!env || dead.Empty()) {
        return 0;
    }
    auto refs = dead.DrainAll();
    for(auto&& ref : refs) {
        env->DeleteGlobalRef(ref);
    }
    LOG("JNIBridge", "Reaped %zu dead references", refs.size());
    return refs.size();
}

size_t Reaper::Discard() {
    auto refs = dead.DrainAll();
    if(!refs.empty()) {
        LOG("JNIBridge", "Dropped %zu references of a destroyed vm", refs.size());
    }
    return refs.size();
}

size_t Reaper::Close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
        wake = nullptr;
    }
    return Discard();
}

bool Reaper::IsClosed() {
    std::lock_guard<std::mutex> lock(mtx);
    return closed;
}

size_t Reaper::PendingCount() const {
    return dead.Size();
}
