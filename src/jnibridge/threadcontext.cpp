#include <jnibridge/threadcontext.h>
#include <jnibridge/throwable.h>
#include "internal/log.h"

using namespace jnibridge;

// Only the owning thread touches its context, the map itself is shared
ThreadContext &ThreadRegistry::Current() {
    std::lock_guard<std::mutex> lock(mtx);
    return contexts[std::this_thread::get_id()];
}

ThreadContext *ThreadRegistry::Find() const {
    std::lock_guard<std::mutex> lock(mtx);
    auto f = contexts.find(std::this_thread::get_id());
    return f != contexts.end() ? const_cast<ThreadContext*>(&f->second) : nullptr;
}

void ThreadRegistry::Erase() {
    std::lock_guard<std::mutex> lock(mtx);
    auto f = contexts.find(std::this_thread::get_id());
    if(f != contexts.end() && !f->second.env && !f->second.attachCount && f->second.envStack.empty() && !f->second.attached) {
        contexts.erase(f);
    }
}

void ThreadRegistry::Bind(JavaVM *vm, JNIEnv *env) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        javaVM = vm;
    }
    auto& ctx = Current();
    ctx.env = env;
    ctx.bound = true;
}

void ThreadRegistry::Unbind() {
    if(auto ctx = Find()) {
        ctx->env = nullptr;
        ctx->bound = false;
        ctx->attached = false;
        ctx->attachCount = 0;
        ctx->envStack.clear();
    }
    Erase();
    std::lock_guard<std::mutex> lock(mtx);
    javaVM = nullptr;
}

JavaVM *ThreadRegistry::GetJavaVM() const {
    std::lock_guard<std::mutex> lock(mtx);
    return javaVM;
}

void ThreadRegistry::SetAttachHook(std::function<void(JNIEnv *)> hook) {
    std::lock_guard<std::mutex> lock(mtx);
    attachHook = std::move(hook);
}

JNIEnv *ThreadRegistry::Attach() {
    auto vm = GetJavaVM();
    if(!vm) {
        throw LifecycleError("Attach called while the Java VM is not running");
    }
    auto& ctx = Current();
    // Inside a callback the thread already has java frames
    if(ctx.attachCount == 0 && !ctx.bound && !ctx.attached && ctx.envStack.empty()) {
        JNIEnv* env = nullptr;
        auto res = vm->AttachCurrentThread((void**)&env, nullptr);
        if(res != JNI_OK || !env) {
            LOG("JNIBridge", "AttachCurrentThread failed with %d", (int)res);
            Erase();
            throw SetupError("Failed to attach to current thread. Return code = " + std::to_string(res), res);
        }
        ctx.env = env;
        ctx.attached = true;
        ctx.attachCount = 1;
        std::function<void(JNIEnv*)> hook;
        {
            std::lock_guard<std::mutex> lock(mtx);
            hook = attachHook;
        }
        if(hook) {
            try {
                hook(env);
            } catch(...) {
                Detach();
                throw;
            }
        }
        return env;
    }
    ctx.attachCount++;
    return ctx.env;
}

void ThreadRegistry::Detach() {
    auto ctx = Find();
    if(!ctx || ctx->attachCount <= 0) {
        throw LifecycleError("Detach called without a matching Attach");
    }
    if(--ctx->attachCount > 0) {
        return;
    }
    Release(*ctx);
}

void ThreadRegistry::Release(ThreadContext &ctx) {
    // The env of an active callback stays until its Exit
    if(!ctx.attached || ctx.attachCount > 0 || !ctx.envStack.empty()) {
        return;
    }
    ctx.env = nullptr;
    ctx.attached = false;
    if(auto vm = GetJavaVM()) {
        auto res = vm->DetachCurrentThread();
        if(res != JNI_OK) {
            LOG("JNIBridge", "DetachCurrentThread failed with %d", (int)res);
        }
    }
    Erase();
}

void ThreadRegistry::DetachAll() {
    while(AttachCount() > 0) {
        Detach();
    }
}

int ThreadRegistry::AttachCount() const {
    auto ctx = Find();
    return ctx ? ctx->attachCount : 0;
}

void ThreadRegistry::Enter(JNIEnv *env) {
    auto& ctx = Current();
    ctx.envStack.push_back(ctx.env);
    ctx.env = env;
}

void ThreadRegistry::Exit() {
    auto ctx = Find();
    if(!ctx || ctx->envStack.empty()) {
        throw LifecycleError("Exit called without a matching Enter");
    }
    ctx->env = ctx->envStack.back();
    ctx->envStack.pop_back();
    // Finishes a Detach deferred by the callback
    Release(*ctx);
    Erase();
}

JNIEnv *ThreadRegistry::GetEnv() const {
    if(!GetJavaVM()) {
        return nullptr;
    }
    auto ctx = Find();
    return ctx ? ctx->env : nullptr;
}
