#include "fakejni.h"
#include <cstring>

using namespace jnibridge::test;

namespace {
    FakeJvm * current = nullptr;

    bool Missing(const char * name) {
        return name && !strncmp(name, "missing", 7);
    }

    jclass NewClass(JNIEnv * env) {
        return (jclass)FakeJvm::From(env).NewHandle();
    }

    const char fakeString[] = "fake";
}

FakeJvm::FakeJvm() : nextHandle(0x1000), newGlobalRefs(0), deleteGlobalRefs(0), pushedFrames(0), poppedFrames(0), attaches(0), detaches(0), destroyed(0), registeredNatives(0), pending(false), failAllocations(false), arrayLength(0) {
    memset(&ninterface, 0, sizeof(ninterface));
    memset(&iinterface, 0, sizeof(iinterface));
    ninterface.reserved0 = this;
    iinterface.reserved0 = this;

    ninterface.GetVersion = [](JNIEnv *) -> jint {
        return JNI_VERSION_1_8;
    };
    ninterface.FindClass = [](JNIEnv * env, const char * name) -> jclass {
        auto&& jvm = From(env);
        if(Missing(name)) {
            jvm.pending = true;
            return nullptr;
        }
        return NewClass(env);
    };
    ninterface.GetObjectClass = [](JNIEnv * env, jobject) -> jclass {
        return NewClass(env);
    };
    ninterface.IsSameObject = [](JNIEnv *, jobject a, jobject b) -> jboolean {
        return a == b;
    };
    ninterface.IsInstanceOf = [](JNIEnv *, jobject, jclass) -> jboolean {
        return JNI_TRUE;
    };
    ninterface.ExceptionCheck = [](JNIEnv * env) -> jboolean {
        return From(env).pending.load();
    };
    ninterface.ExceptionOccurred = [](JNIEnv * env) -> jthrowable {
        auto&& jvm = From(env);
        return jvm.pending ? (jthrowable)jvm.NewHandle() : nullptr;
    };
    ninterface.ExceptionClear = [](JNIEnv * env) {
        From(env).pending = false;
    };
    ninterface.PushLocalFrame = [](JNIEnv * env, jint) -> jint {
        From(env).pushedFrames++;
        return JNI_OK;
    };
    ninterface.PopLocalFrame = [](JNIEnv * env, jobject) -> jobject {
        From(env).poppedFrames++;
        return nullptr;
    };
    ninterface.NewGlobalRef = [](JNIEnv * env, jobject ref) -> jobject {
        auto&& jvm = From(env);
        if(!ref) {
            return nullptr;
        }
        jvm.newGlobalRefs++;
        return jvm.NewHandle();
    };
    ninterface.DeleteGlobalRef = [](JNIEnv * env, jobject ref) {
        From(env).OnDelete(ref);
    };
    ninterface.DeleteLocalRef = [](JNIEnv *, jobject) {
    };
    ninterface.GetMethodID = [](JNIEnv * env, jclass, const char * name, const char *) -> jmethodID {
        return Missing(name) ? nullptr : (jmethodID)From(env).NewHandle();
    };
    ninterface.GetStaticMethodID = [](JNIEnv * env, jclass, const char * name, const char *) -> jmethodID {
        return Missing(name) ? nullptr : (jmethodID)From(env).NewHandle();
    };
    ninterface.CallObjectMethodA = [](JNIEnv * env, jobject, jmethodID, const jvalue *) -> jobject {
        return From(env).NewHandle();
    };
    ninterface.CallStaticObjectMethodA = [](JNIEnv * env, jclass, jmethodID, const jvalue *) -> jobject {
        return From(env).NewHandle();
    };
    ninterface.CallVoidMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue *) {
    };
    ninterface.CallIntMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jint {
        return args ? args[0].i : 0;
    };
    ninterface.CallStaticIntMethodA = [](JNIEnv *, jclass, jmethodID, const jvalue * args) -> jint {
        return args ? args[0].i : 0;
    };
    // Every other instance call echoes its first argument
    ninterface.CallBooleanMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jboolean {
        return args ? args[0].z : JNI_FALSE;
    };
    ninterface.CallByteMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jbyte {
        return args ? args[0].b : 0;
    };
    ninterface.CallCharMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jchar {
        return args ? args[0].c : 0;
    };
    ninterface.CallShortMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jshort {
        return args ? args[0].s : 0;
    };
    ninterface.CallLongMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jlong {
        return args ? args[0].j : 0;
    };
    ninterface.CallFloatMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jfloat {
        return args ? args[0].f : 0;
    };
    ninterface.CallDoubleMethodA = [](JNIEnv *, jobject, jmethodID, const jvalue * args) -> jdouble {
        return args ? args[0].d : 0;
    };
    ninterface.NewString = [](JNIEnv * env, const jchar *, jsize) -> jstring {
        auto&& jvm = From(env);
        return jvm.failAllocations ? nullptr : (jstring)jvm.NewHandle();
    };
    ninterface.NewStringUTF = [](JNIEnv * env, const char *) -> jstring {
        auto&& jvm = From(env);
        return jvm.failAllocations ? nullptr : (jstring)jvm.NewHandle();
    };
    ninterface.NewIntArray = [](JNIEnv * env, jsize) -> jintArray {
        auto&& jvm = From(env);
        return jvm.failAllocations ? nullptr : (jintArray)jvm.NewHandle();
    };
    ninterface.NewObjectArray = [](JNIEnv * env, jsize, jclass, jobject) -> jobjectArray {
        auto&& jvm = From(env);
        return jvm.failAllocations ? nullptr : (jobjectArray)jvm.NewHandle();
    };
    ninterface.SetIntArrayRegion = [](JNIEnv * env, jintArray, jsize start, jsize len, const jint * buf) {
        auto&& jvm = From(env);
        std::lock_guard<std::mutex> lock(jvm.mtx);
        jvm.intRegion.assign(buf + start, buf + start + len);
    };
    ninterface.GetArrayLength = [](JNIEnv * env, jarray) -> jsize {
        return From(env).arrayLength;
    };
    ninterface.GetObjectArrayElement = [](JNIEnv * env, jobjectArray, jsize) -> jobject {
        return From(env).NewHandle();
    };
    ninterface.GetStringUTFChars = [](JNIEnv *, jstring, jboolean * isCopy) -> const char * {
        if(isCopy) {
            *isCopy = JNI_FALSE;
        }
        return fakeString;
    };
    ninterface.GetStringUTFLength = [](JNIEnv *, jstring) -> jsize {
        return (jsize)strlen(fakeString);
    };
    ninterface.ReleaseStringUTFChars = [](JNIEnv *, jstring, const char *) {
    };
    ninterface.RegisterNatives = [](JNIEnv * env, jclass, const JNINativeMethod *, jint count) -> jint {
        From(env).registeredNatives += count;
        return JNI_OK;
    };

    iinterface.DestroyJavaVM = [](JavaVM * vm) -> jint {
        From(vm).destroyed++;
        return JNI_OK;
    };
    iinterface.AttachCurrentThread = [](JavaVM * vm, void ** penv, void *) -> jint {
        auto&& jvm = From(vm);
        if(jvm.attachResult != JNI_OK) {
            return jvm.attachResult;
        }
        jvm.attaches++;
        *penv = jvm.GetJNIEnv();
        return JNI_OK;
    };
    iinterface.DetachCurrentThread = [](JavaVM * vm) -> jint {
        From(vm).detaches++;
        return JNI_OK;
    };
    iinterface.GetEnv = [](JavaVM * vm, void ** penv, jint) -> jint {
        *penv = From(vm).GetJNIEnv();
        return JNI_OK;
    };

    env.functions = &ninterface;
    vm.functions = &iinterface;
}

FakeJvm::~FakeJvm() {
    if(current == this) {
        current = nullptr;
    }
}

jobject FakeJvm::NewHandle() {
    return (jobject)nextHandle.fetch_add(8);
}

void FakeJvm::OnDelete(jobject ref) {
    deleteGlobalRefs++;
    std::lock_guard<std::mutex> lock(mtx);
    deleted.push_back(ref);
}

std::vector<jobject> FakeJvm::Deleted() {
    std::lock_guard<std::mutex> lock(mtx);
    return deleted;
}

std::vector<jint> FakeJvm::IntRegion() {
    std::lock_guard<std::mutex> lock(mtx);
    return intRegion;
}

std::vector<std::string> FakeJvm::Options() {
    std::lock_guard<std::mutex> lock(mtx);
    return options;
}

jint FakeJvm::CreateJavaVM(JavaVM **pvm, void **penv, void *args) {
    auto jvm = current;
    if(!jvm) {
        return JNI_ERR;
    }
    if(jvm->createResult != JNI_OK) {
        return jvm->createResult;
    }
    auto initArgs = (JavaVMInitArgs *)args;
    {
        std::lock_guard<std::mutex> lock(jvm->mtx);
        for(jint i = 0; i < initArgs->nOptions; i++) {
            jvm->options.emplace_back(initArgs->options[i].optionString);
        }
    }
    *pvm = jvm->GetJavaVM();
    *penv = jvm->GetJNIEnv();
    return JNI_OK;
}

jnibridge::LibraryOptions FakeJvm::Loader() {
    current = this;
    return LibraryOptions([](const char * path, int) -> void * {
        return path && *path && current ? current : nullptr;
    }, [](void *, const char * name) -> void * {
        return !strcmp(name, "JNI_CreateJavaVM") ? (void *)&FakeJvm::CreateJavaVM : nullptr;
    }, [](void *) -> int {
        return 0;
    });
}

FakeSession::FakeSession() : threads(std::make_shared<ThreadRegistry>()), reaper(std::make_shared<Reaper>(threads)), env(jvm.GetJNIEnv(), reaper) {
    threads->Bind(jvm.GetJavaVM(), jvm.GetJNIEnv());
}

FakeSession::~FakeSession() {
    threads->Unbind();
}
