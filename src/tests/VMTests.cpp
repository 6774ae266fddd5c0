#include <gtest/gtest.h>
#include <jnibridge.h>
#include <jnibridge/reaper.h>
#include <algorithm>
#include <thread>
#include "fakejni.h"

using namespace jnibridge;
using jnibridge::test::FakeJvm;

static VMOptions FakeOptions(FakeJvm & jvm) {
    VMOptions options;
    options.libjvmPath = "libjvm-fake.so";
    options.classPath = std::vector<std::string>{};
    options.loader = jvm.Loader();
    return options;
}

TEST(VM, KillWithoutStart) {
    VM vm;
    ASSERT_EQ(vm.GetState(), VMState::Uninitialized);
    vm.Kill();
    ASSERT_EQ(vm.GetState(), VMState::Uninitialized);
    ASSERT_THROW(vm.RunInMainThread([]() {}, true), LifecycleError);
    ASSERT_THROW(vm.GetEnv(), LifecycleError);
}

TEST(VM, StartAndKill) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    ASSERT_TRUE(vm.IsActive());
    ASSERT_EQ(vm.GetJavaVM(), jvm.GetJavaVM());
    ASSERT_EQ(vm.GetJNIEnv(), jvm.GetJNIEnv());
    ASSERT_FALSE(vm.IsMainThread());
    ASSERT_EQ(jvm.attaches.load(), 1);
    // Starting twice does nothing
    vm.Start(FakeOptions(jvm));
    ASSERT_EQ(jvm.attaches.load(), 1);

    vm.Kill();
    ASSERT_EQ(vm.GetState(), VMState::Destroyed);
    ASSERT_EQ(jvm.detaches.load(), 1);
    ASSERT_EQ(jvm.destroyed.load(), 1);
    ASSERT_EQ(vm.GetJavaVM(), nullptr);
    ASSERT_EQ(vm.GetJNIEnv(), nullptr);
    // Killing twice does nothing
    vm.Kill();
    ASSERT_EQ(jvm.destroyed.load(), 1);
}

TEST(VM, NoRestartAfterKill) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    vm.Kill();
    ASSERT_THROW(vm.Start(FakeOptions(jvm)), LifecycleError);
    ASSERT_EQ(vm.GetState(), VMState::Destroyed);
}

TEST(VM, Options) {
    FakeJvm jvm;
    VM vm;
    auto options = FakeOptions(jvm);
    options.args = { "-Xss4m" };
    options.classPath = std::vector<std::string>{ "a.jar", "b.jar" };
    options.maxHeapSize = "512m";
    options.runHeadless = true;
    vm.Start(options);
    auto passed = jvm.Options();
    std::vector<std::string> expected = { "-Xss4m", "-Djava.class.path=a.jar:b.jar", "-Xmx512m", "-Djava.awt.headless=true" };
    ASSERT_EQ(passed, expected);
    vm.Kill();
}

TEST(VM, ClassPathInArgsIsRejected) {
    FakeJvm jvm;
    VM vm;
    for(auto&& arg : { "-cp", "-classpath", "-Djava.class.path=a.jar" }) {
        auto options = FakeOptions(jvm);
        options.args = { arg };
        ASSERT_THROW(vm.Start(options), JavaError) << arg;
    }
    ASSERT_EQ(vm.GetState(), VMState::Uninitialized);
}

TEST(VM, MissingLibraryKeepsUninitialized) {
    FakeJvm jvm;
    VM vm;
    auto options = FakeOptions(jvm);
    options.loader = LibraryOptions([](const char *, int) -> void * {
        return nullptr;
    }, [](void *, const char *) -> void * {
        return nullptr;
    }, [](void *) -> int {
        return 0;
    });
    options.libjvmPath = "/nonexistent/libjvm.so";
    ASSERT_THROW(vm.Start(options), SetupError);
    ASSERT_EQ(vm.GetState(), VMState::Uninitialized);
}

TEST(VM, CreateFailureCarriesCode) {
    FakeJvm jvm;
    jvm.createResult = JNI_ENOMEM;
    VM vm;
    try {
        vm.Start(FakeOptions(jvm));
        FAIL() << "Start succeeded";
    } catch(const SetupError & ex) {
        ASSERT_EQ(ex.GetCode(), JNI_ENOMEM);
        ASSERT_NE(std::string(ex.what()).find(std::to_string(JNI_ENOMEM)), std::string::npos);
    }
    ASSERT_EQ(vm.GetState(), VMState::Destroyed);
    ASSERT_EQ(jvm.attaches.load(), 0);
}

TEST(VM, NativesAreRegistered) {
    FakeJvm jvm;
    VM vm;
    auto options = FakeOptions(jvm);
    options.natives.push_back({ "org.example.Callbacks", { { "invoke", "(J)V", nullptr }, { "release", "(J)V", nullptr } } });
    vm.Start(options);
    ASSERT_EQ(jvm.registeredNatives.load(), 2);
    vm.Kill();
}

TEST(VM, ClosuresRunInOrder) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    std::vector<int> order;
    for(int i = 0; i < 10; i++) {
        vm.RunInMainThread([&order, i]() {
            order.push_back(i);
        }, false);
    }
    vm.RunInMainThread([]() {}, true);
    std::vector<int> expected(10);
    for(int i = 0; i < 10; i++) {
        expected[i] = i;
    }
    ASSERT_EQ(order, expected);
    vm.Kill();
}

TEST(VM, SynchronousClosureRethrows) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    ASSERT_THROW(vm.RunInMainThread([]() {
        throw JavaError("failed on the main thread");
    }, true), JavaError);
    // An asynchronous failure only gets logged
    vm.RunInMainThread([]() {
        throw JavaError("failed on the main thread");
    }, false);
    ASSERT_TRUE(vm.CallInMainThread<bool>([&vm]() {
        return vm.IsMainThread();
    }));
    vm.Kill();
}

TEST(VM, NestedClosuresRunInline) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    auto value = vm.CallInMainThread<int>([&vm]() {
        int inner = 0;
        vm.RunInMainThread([&inner]() {
            inner = 42;
        }, true);
        return inner;
    });
    ASSERT_EQ(value, 42);
    vm.Kill();
}

TEST(VM, ReleasesFromDetachedThreadsAreReaped) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    auto handle = jvm.NewHandle();
    std::thread([&]() {
        Object obj(handle, vm.GetReaper());
    }).join();
    // Each wake reaps before running closures
    vm.RunInMainThread([]() {}, true);
    ASSERT_EQ(vm.GetReaper()->PendingCount(), 0);
    auto deleted = jvm.Deleted();
    ASSERT_EQ(std::count(deleted.begin(), deleted.end(), handle), 1);
    vm.Kill();
}

TEST(VM, ShutdownHookRunsFirst) {
    FakeJvm jvm;
    VM vm;
    auto options = FakeOptions(jvm);
    bool ran = false;
    auto pjvm = &jvm;
    options.shutdownHook = [&ran, pjvm]() {
        ran = pjvm->destroyed == 0;
    };
    vm.Start(options);
    vm.Kill();
    ASSERT_TRUE(ran);
}

TEST(VM, AttachFromOtherThreads) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    std::thread([&]() {
        auto env = vm.Attach();
        ASSERT_EQ(env->GetJNIEnv(), jvm.GetJNIEnv());
        vm.Attach();
        vm.Detach();
        vm.Detach();
        ASSERT_THROW(vm.Detach(), LifecycleError);
    }).join();
    ASSERT_EQ(jvm.attaches.load(), 2);
    ASSERT_EQ(jvm.detaches.load(), 1);
    vm.Kill();
}

TEST(VM, AsynchronousClosureThrowingAnything) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    vm.RunInMainThread([]() {
        throw 42;
    }, false);
    // The main thread survives
    ASSERT_TRUE(vm.CallInMainThread<bool>([&vm]() {
        return vm.IsMainThread();
    }));
    vm.Kill();
    ASSERT_EQ(vm.GetState(), VMState::Destroyed);
    ASSERT_EQ(jvm.destroyed.load(), 1);
}

TEST(VM, ReleasesAfterKillAreDropped) {
    FakeJvm jvm;
    VM vm;
    vm.Start(FakeOptions(jvm));
    auto reaper = vm.GetReaper();
    vm.Kill();
    ASSERT_TRUE(reaper->IsClosed());
    auto deleted = jvm.deleteGlobalRefs.load();
    std::thread([&]() {
        Object obj(jvm.NewHandle(), reaper);
    }).join();
    {
        Object obj(jvm.NewHandle(), reaper);
    }
    ASSERT_EQ(reaper->PendingCount(), 0);
    ASSERT_EQ(jvm.deleteGlobalRefs.load(), deleted);
}
