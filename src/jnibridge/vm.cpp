#include <jnibridge/vm.h>
#include <jnibridge/locate.h>
#include <jnibridge/reaper.h>
#include <jnibridge/threadcontext.h>
#include <jnibridge/throwable.h>
#include <jnibridge/util.h>
#include <dlfcn.h>
#include "internal/log.h"

using namespace jnibridge;

const char *jnibridge::ToString(VMState state) {
    switch (state) {
    case VMState::Uninitialized:
        return "Uninitialized";
    case VMState::Starting:
        return "Starting";
    case VMState::Active:
        return "Active";
    case VMState::ShuttingDown:
        return "ShuttingDown";
    case VMState::Destroyed:
        return "Destroyed";
    }
    return "Unknown";
}

JvmLibrary::JvmLibrary(const std::string &rpath, LibraryOptions loptions) : loptions(loptions), handle(nullptr), createJavaVM(nullptr), used(false) {
    handle = loptions.dlopen(rpath.data(), RTLD_NOW | RTLD_GLOBAL);
    if(!handle) {
        throw SetupError("Failed to load " + rpath);
    }
    createJavaVM = (jint (*)(JavaVM **, void **, void *))loptions.dlsym(handle, "JNI_CreateJavaVM");
    if(!createJavaVM) {
        loptions.dlclose(handle);
        throw SetupError("JNI_CreateJavaVM not found in " + rpath);
    }
    LOG("JNIBridge", "Loaded %s", rpath.data());
}

JvmLibrary::~JvmLibrary() {
    if(!used) {
        loptions.dlclose(handle);
    }
}

jint JvmLibrary::CreateJavaVM(JavaVM **vm, JNIEnv **env, JavaVMInitArgs *args) {
    used = true;
    return createJavaVM(vm, (void**)env, args);
}

VM::VM() : threads(std::make_shared<ThreadRegistry>()), state(VMState::Uninitialized) {
    reaper = std::make_shared<Reaper>(threads);
    reaper->SetWakeHandler([this]() {
        Wake();
    });
    threads->SetAttachHook([this](JNIEnv * env) {
        ENV jenv(env, reaper);
        InitContextClassLoader(jenv);
    });
}

VM::~VM() {
    if(IsActive()) {
        try {
            Kill();
        } catch(const std::exception & ex) {
            LOG("JNIBridge", "Failed to kill the Java VM: %s", ex.what());
        }
    }
    reaper->SetWakeHandler(nullptr);
    threads->SetAttachHook(nullptr);
}

void VM::Start(VMOptions options) {
    std::lock_guard<std::mutex> guard(lifecycle);
    for(auto&& arg : options.args) {
        if(arg == "-cp" || arg == "-classpath" || arg.rfind("-Djava.class.path=", 0) == 0) {
            throw JavaError("Cannot set Java class path in the args argument to Start. Use the classPath option instead.");
        }
    }
    switch (GetState()) {
    case VMState::Active:
        return;
    case VMState::Uninitialized:
        break;
    default:
        throw LifecycleError(std::string("Cannot start the Java VM, it is ") + ToString(GetState()));
    }

    std::vector<std::string> jvmArgs = options.args;
    auto classPath = options.classPath ? *options.classPath : DefaultClassPath();
    if(!classPath.empty()) {
        std::string joined;
        for(auto&& entry : classPath) {
            if(!joined.empty()) {
                joined += ':';
            }
            joined += entry;
        }
        jvmArgs.push_back("-Djava.class.path=" + joined);
    }
    if(!options.maxHeapSize.empty()) {
        jvmArgs.push_back("-Xmx" + options.maxHeapSize);
    }
    if(options.runHeadless) {
        jvmArgs.push_back("-Djava.awt.headless=true");
    }

    // Nothing happened yet if the library can't be found or loaded
    library = std::make_unique<JvmLibrary>(options.libjvmPath.empty() ? FindJvmLibrary() : options.libjvmPath, options.loader);
    shutdownHook = options.shutdownHook;
    {
        std::lock_guard<std::mutex> lock(mtx);
        wake = false;
        kill = false;
        closures.clear();
    }
    state = VMState::Starting;
    std::promise<void> started;
    auto ready = started.get_future();
    std::promise<void> died;
    dead = died.get_future();
    monitor = std::thread(&VM::Monitor, this, std::move(options), std::move(jvmArgs), std::move(started), std::move(died));
    try {
        ready.get();
    } catch(...) {
        monitor.join();
        library.reset();
        throw;
    }
    threads->Attach();
    LOG("JNIBridge", "Java VM started");
}

void VM::Monitor(VMOptions options, std::vector<std::string> jvmArgs, std::promise<void> started, std::promise<void> died) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        monitorId = std::this_thread::get_id();
    }
    JavaVM * javaVM = nullptr;
    try {
        std::vector<JavaVMOption> jvmOptions(jvmArgs.size());
        for(size_t i = 0; i < jvmArgs.size(); i++) {
            jvmOptions[i].optionString = const_cast<char*>(jvmArgs[i].data());
            jvmOptions[i].extraInfo = nullptr;
        }
        JavaVMInitArgs initArgs;
        initArgs.version = options.version;
        initArgs.nOptions = (jint)jvmOptions.size();
        initArgs.options = jvmOptions.data();
        initArgs.ignoreUnrecognized = options.ignoreUnrecognized ? JNI_TRUE : JNI_FALSE;
        LOG("JNIBridge", "Creating Java VM with %d options", (int)initArgs.nOptions);
        JNIEnv * env = nullptr;
        auto res = library->CreateJavaVM(&javaVM, &env, &initArgs);
        if(res != JNI_OK || !javaVM || !env) {
            javaVM = nullptr;
            throw SetupError("Failed to create Java VM. Return code = " + std::to_string(res), res);
        }
        threads->Bind(javaVM, env);
        ENV jenv(env, reaper);
        for(auto&& registration : options.natives) {
            jenv.RegisterNatives(*jenv.FindClass(registration.className), registration.methods);
        }
        InitContextClassLoader(jenv);
    } catch(...) {
        if(javaVM) {
            threads->Unbind();
            javaVM->DestroyJavaVM();
        }
        reaper->Close();
        {
            std::lock_guard<std::mutex> lock(mtx);
            monitorId = std::thread::id();
        }
        // A jvm can't be created twice in the same process
        state = VMState::Destroyed;
        started.set_exception(std::current_exception());
        died.set_value();
        return;
    }
    state = VMState::Active;
    started.set_value();

    std::unique_lock<std::mutex> lock(mtx);
    while(true) {
        wakeup.wait(lock, [this]() {
            return wake;
        });
        wake = false;
        lock.unlock();
        reaper->Reap();
        std::function<void()> closure;
        while(NextClosure(closure)) {
            closure();
        }
        lock.lock();
        if(kill && closures.empty()) {
            break;
        }
    }
    monitorId = std::thread::id();
    lock.unlock();

    reaper->Reap();
    threads->Unbind();
    auto res = javaVM->DestroyJavaVM();
    if(res != JNI_OK) {
        LOG("JNIBridge", "DestroyJavaVM failed with %d", (int)res);
    }
    reaper->Close();
    died.set_value();
}

void VM::Kill() {
    std::lock_guard<std::mutex> guard(lifecycle);
    if(GetState() != VMState::Active) {
        return;
    }
    if(IsMainThread()) {
        throw LifecycleError("Kill cannot be called on the main thread of the Java VM");
    }
    state = VMState::ShuttingDown;
    if(shutdownHook) {
        try {
            shutdownHook();
        } catch(const std::exception & ex) {
            LOG("JNIBridge", "Shutdown hook failed: %s", ex.what());
        }
    }
    reaper->Reap();
    threads->DetachAll();
    {
        std::lock_guard<std::mutex> lock(mtx);
        kill = true;
        wake = true;
    }
    wakeup.notify_one();
    dead.get();
    monitor.join();
    library.reset();
    state = VMState::Destroyed;
    LOG("JNIBridge", "Java VM destroyed");
}

JavaVM *VM::GetJavaVM() const {
    return threads->GetJavaVM();
}

std::shared_ptr<ENV> VM::Attach() {
    return std::make_shared<ENV>(threads->Attach(), reaper);
}

void VM::Detach() {
    threads->Detach();
}

std::shared_ptr<ENV> VM::GetEnv() {
    auto env = threads->GetEnv();
    if(!env) {
        throw LifecycleError("The current thread is not attached to the Java VM");
    }
    return std::make_shared<ENV>(env, reaper);
}

JNIEnv *VM::GetJNIEnv() {
    return threads->GetEnv();
}

bool VM::IsMainThread() {
    std::lock_guard<std::mutex> lock(mtx);
    return monitorId == std::this_thread::get_id();
}

void VM::Wake() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        wake = true;
    }
    wakeup.notify_one();
}

void VM::Enqueue(std::function<void()> closure) {
    auto current = GetState();
    if(current != VMState::Active && current != VMState::ShuttingDown) {
        throw LifecycleError(std::string("Cannot run closures while the Java VM is ") + ToString(current));
    }
    {
        std::lock_guard<std::mutex> lock(mtx);
        if(kill) {
            throw LifecycleError("Cannot run closures while the Java VM is going down");
        }
        closures.push_back(std::move(closure));
        wake = true;
    }
    wakeup.notify_one();
}

bool VM::NextClosure(std::function<void()> &closure) {
    std::lock_guard<std::mutex> lock(mtx);
    if(closures.empty()) {
        return false;
    }
    closure = std::move(closures.front());
    closures.pop_front();
    return true;
}

void VM::RunInMainThread(std::function<void()> closure, bool synchronous) {
    if(IsMainThread()) {
        closure();
        return;
    }
    if(synchronous) {
        auto done = std::make_shared<std::promise<void>>();
        auto finished = done->get_future();
        Enqueue([closure, done]() {
            try {
                closure();
                done->set_value();
            } catch(...) {
                done->set_exception(std::current_exception());
            }
        });
        finished.get();
    } else {
        Enqueue([closure]() {
            try {
                closure();
            } catch(const std::exception & ex) {
                LOG("JNIBridge", "Closure failed on the main thread: %s", ex.what());
            } catch(...) {
                LOG("JNIBridge", "Closure failed on the main thread with an unknown exception");
            }
        });
    }
}
