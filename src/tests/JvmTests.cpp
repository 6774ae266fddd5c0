#include <gtest/gtest.h>
#include <jnibridge.h>
#include <jnibridge/locate.h>
#include <algorithm>
#include <map>
#include <thread>

using namespace jnibridge;

// A jvm can only be created once per process, all tests share it
class JvmEnvironment : public ::testing::Environment {
public:
    static VM & GetVM() {
        static VM vm;
        return vm;
    }

    void SetUp() override {
        try {
            FindJvmLibrary();
        } catch(const JVMNotFoundError &) {
            return;
        }
        VMOptions options;
        options.runHeadless = true;
        // org.jnibridge.ProxyHandler
        auto classPath = DefaultClassPath();
        classPath.push_back(JNIBRIDGE_JAR);
        options.classPath = classPath;
        GetVM().Start(options);
    }

    void TearDown() override {
        GetVM().Kill();
    }
};

static auto * const jvmEnvironment = ::testing::AddGlobalTestEnvironment(new JvmEnvironment());

#define REQUIRE_JVM() \
    if(!JvmEnvironment::GetVM().IsActive()) { \
        GTEST_SKIP() << "No Java VM found, set JAVA_HOME"; \
    }

TEST(JVM, HelloWorld) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto str = env->NewStringUTF("Hello, world");
    ASSERT_EQ(env->GetStringUTF(*str), "Hello, world");
    ASSERT_EQ(env->GetStringLength(*str), 12);
    str->Release();
    ASSERT_TRUE(str->IsReleased());
}

TEST(JVM, Utf16Strings) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    std::string text = "Gr\xc3\xbc\xc3\x9f" "e \xf0\x9f\x98\x80";
    auto str = env->NewString(text);
    ASSERT_EQ(env->GetString(*str), text);
    // The emoji needs a surrogate pair
    ASSERT_EQ(env->GetStringLength(*str), 8);
}

TEST(JVM, ObjectArray) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto array = env->MakeObjectArray(15, *env->FindClass("java.lang.String"));
    ASSERT_EQ(env->GetArrayLength(*array), 15);
    for(jsize i = 0; i < 15; i++) {
        env->SetObjectArrayElement(*array, i, env->NewString(std::to_string(i)));
    }
    auto elements = env->GetObjectArrayElements(*array);
    ASSERT_EQ(elements.size(), 15);
    for(size_t i = 0; i < elements.size(); i++) {
        ASSERT_EQ(env->GetString(*elements[i]), std::to_string(i));
    }
}

TEST(JVM, PrimitiveArrays) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    std::vector<jint> ints = { 1, -2, 3, 1 << 30 };
    auto array = env->MakeArray(ints);
    ASSERT_EQ(env->GetArrayElements<jint>(*array), ints);
    std::vector<jdouble> doubles = { 0.5, -1e100 };
    ASSERT_EQ(env->GetArrayElements<jdouble>(*env->MakeArray(doubles)), doubles);
    auto bytes = GetNiceArg(*env, Value::Sequence{ 1, 2, 3 }, "[B");
    ASSERT_EQ(env->GetArrayElements<jbyte>(*bytes.AsObject()), (std::vector<jbyte>{ 1, 2, 3 }));
}

TEST(JVM, StaticCallWithoutMatchingOverload) {
    REQUIRE_JVM();
    JClassWrapper integer(JvmEnvironment::GetVM().GetEnv(), "java.lang.Integer");
    try {
        integer.Invoke("parseInt", { 1, 2, 3, 4 });
        FAIL() << "parseInt accepted four ints";
    } catch(const TypeError & ex) {
        ASSERT_NE(std::string(ex.what()).find("parseInt"), std::string::npos);
    }
}

TEST(JVM, ClassWrapper) {
    REQUIRE_JVM();
    JClassWrapper integer(JvmEnvironment::GetVM().GetEnv(), "java.lang.Integer");
    ASSERT_EQ(integer.GetField("MAX_VALUE").AsInt(), 2147483647);
    ASSERT_EQ(integer.Invoke("valueOf", { "42" }).AsInt(), 42);
    ASSERT_EQ(integer.Invoke("toHexString", { 255 }), Value("ff"));
    ASSERT_THROW(integer.GetField("NOT_A_FIELD"), AttributeError);
    ASSERT_THROW(integer.Invoke("notAMethod"), AttributeError);
    auto boxed = integer.NewInstance({ 5 });
    ASSERT_EQ(ToString(*JvmEnvironment::GetVM().GetEnv(), *boxed), "5");
}

TEST(JVM, ObjectWrapper) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    JWrapper list(env, MakeInstance(*env, "java/util/ArrayList", "()V"));
    list.Invoke("add", { "Hello" });
    list.Invoke("add", { "World" });
    ASSERT_EQ(list.Invoke("size").AsInt(), 2);
    ASSERT_EQ(list.Invoke("get", { 0 }), Value("Hello"));
    ASSERT_EQ(list.ToString(), "[Hello, World]");
    ASSERT_THROW(list.Invoke("get", { "zero" }), TypeError);
    ASSERT_THROW(list.GetField("size"), AttributeError);
    auto names = list.MethodNames();
    ASSERT_NE(std::find(names.begin(), names.end(), "add"), names.end());
}

TEST(JVM, SignatureHelpers) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    ASSERT_EQ(StaticCall(*env, "java/lang/Math", "max", "(II)I", { 3, 7 }).AsInt(), 7);
    ASSERT_EQ(GetStaticField(*env, "java.lang.Integer", "MIN_VALUE", "I").AsInt(), -2147483648ll);
    auto str = env->NewString(std::string("abc"));
    ASSERT_EQ(Call(*env, *str, "length", "()I").AsInt(), 3);
    ASSERT_EQ(Call(*env, *str, "charAt", "(I)C", { 1 }), Value("b"));
    ASSERT_EQ(Call(*env, *str, "concat", "(Ljava/lang/String;)Ljava/lang/String;", { "def" }), Value("abcdef"));
    ASSERT_THROW(Call(*env, *str, "length", "()J"), JavaError);
    ASSERT_TRUE(IsInstanceOf(*env, str, "java/lang/CharSequence"));
    ASSERT_FALSE(IsInstanceOf(*env, 1, "java/lang/CharSequence"));
}

TEST(JVM, JavaExceptions) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    try {
        StaticCall(*env, "java/lang/Integer", "parseInt", "(Ljava/lang/String;)I", { "not a number" });
        FAIL() << "parseInt accepted a word";
    } catch(const JavaException & ex) {
        ASSERT_EQ(ex.GetClassName(), "java.lang.NumberFormatException");
        ASSERT_NE(ex.GetMessage().find("not a number"), std::string::npos);
        ASSERT_NE(ex.GetThrowable(), nullptr);
    }
    ASSERT_FALSE(env->ExceptionCheck());
    ASSERT_THROW(env->FindClass("does.not.Exist"), JavaException);
    auto cl = env->FindClass("java/lang/Integer");
    ASSERT_THROW(env->GetFieldID(*cl, "NOT_A_FIELD", "I"), JavaException);
    ASSERT_EQ(env->GetMethodID(*cl, "notAMethod", "()V"), nullptr);
    ASSERT_FALSE(env->ExceptionCheck());
}

TEST(JVM, ExceptionCause) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto inner = MakeInstance(*env, "java/lang/IllegalStateException", "(Ljava/lang/String;)V", { "inner" });
    auto outer = MakeInstance(*env, "java/lang/RuntimeException", "(Ljava/lang/String;Ljava/lang/Throwable;)V", { "outer", inner });
    env->Throw(*outer);
    try {
        env->ThrowIfPending();
        FAIL() << "Nothing was pending";
    } catch(const JavaException & ex) {
        ASSERT_EQ(ex.GetClassName(), "java.lang.RuntimeException");
        ASSERT_EQ(ex.GetMessage(), "outer");
        ASSERT_NE(ex.GetCause(), nullptr);
        ASSERT_TRUE(env->IsSameObject(*ex.GetCause(), *inner));
    }
    try {
        StaticCall(*env, "java/lang/Integer", "parseInt", "(Ljava/lang/String;)I", { "x" });
        FAIL() << "parseInt accepted a word";
    } catch(const JavaException & ex) {
        ASSERT_EQ(ex.GetCause(), nullptr);
    }
    ASSERT_FALSE(env->ExceptionCheck());
}

TEST(JVM, Classes) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto cl = env->FindClass("java/lang/String");
    ASSERT_EQ(cl->GetName(*env), "java.lang.String");
    ASSERT_EQ(cl->GetSignature(*env), "Ljava/lang/String;");
    ASSERT_EQ(env->FindClass("[I")->GetSignature(*env), "[I");
    auto loaded = ClassForName(*env, "java.util.ArrayList");
    ASSERT_EQ(loaded->GetName(*env), "java.util.ArrayList");
    ASSERT_NE(GetClassLoader(*env), nullptr);
    ASSERT_GE(env->GetVersion().first, 1);
}

TEST(JVM, Collections) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto list = MakeList(*env, { 1, "a", 2.5, true });
    auto values = CollectionToVector(*env, *list);
    ASSERT_EQ(values, (std::vector<Value>{ 1, "a", 2.5, true }));
    auto map = MakeMap(*env, { { "k", 2 } });
    ASSERT_EQ(MapGet(*env, *map, "k"), Value(2));
    ASSERT_TRUE(MapGet(*env, *map, "missing").IsNull());
    MapPut(*env, *map, "l", "v");
    ASSERT_EQ(MapKeys(*env, *map).size(), 2);
}

TEST(JVM, MainThread) {
    REQUIRE_JVM();
    auto & vm = JvmEnvironment::GetVM();
    auto env = vm.GetEnv();
    // A plain Thread is a Runnable doing nothing
    auto runnable = MakeInstance(*env, "java/lang/Thread", "()V");
    ExecuteRunnableInMainThread(vm, runnable, true);
    auto callable = StaticCall(*env, "java/util/concurrent/Executors", "callable", "(Ljava/lang/Runnable;Ljava/lang/Object;)Ljava/util/concurrent/Callable;", { runnable, "done" });
    ASSERT_EQ(ExecuteCallableInMainThread(vm, callable.AsObject(), true), Value("done"));
    ASSERT_EQ(vm.CallInMainThread<std::string>([&vm]() {
        return ToString(*vm.GetEnv(), *vm.GetEnv()->NewString(std::string("main")));
    }), "main");
}

TEST(JVM, OtherThreads) {
    REQUIRE_JVM();
    auto & vm = JvmEnvironment::GetVM();
    std::shared_ptr<Object> str;
    std::thread([&]() {
        auto env = vm.Attach();
        ASSERT_NE(GetClassLoader(*env), nullptr);
        str = env->NewString(std::string("from another thread"));
        vm.Detach();
    }).join();
    auto env = vm.GetEnv();
    ASSERT_EQ(env->GetString(*str), "from another thread");
}

TEST(JVM, ProxyRunnable) {
    REQUIRE_JVM();
    auto & vm = JvmEnvironment::GetVM();
    auto env = vm.GetEnv();
    int runs = 0;
    JProxy runnable(vm, "java.lang.Runnable", { { "run", [&runs](ENV &, const std::vector<Value> & args) -> Value {
        EXPECT_TRUE(args.empty());
        runs++;
        return nullptr;
    } } });
    Call(*env, *runnable.GetObject(), "run", "()V");
    ASSERT_EQ(runs, 1);

    // Called back on a thread java created
    auto thread = MakeInstance(*env, "java/lang/Thread", "(Ljava/lang/Runnable;)V", { runnable.GetObject() });
    Call(*env, *thread, "start", "()V");
    Call(*env, *thread, "join", "()V");
    ASSERT_EQ(runs, 2);

    ASSERT_EQ(ToString(*env, *runnable.GetObject()), "Proxy of java.lang.Runnable");
    ASSERT_EQ(Call(*env, *runnable.GetObject(), "equals", "(Ljava/lang/Object;)Z", { runnable.GetObject() }), Value(true));
    ASSERT_EQ(Call(*env, *runnable.GetObject(), "equals", "(Ljava/lang/Object;)Z", { thread }), Value(false));
    ASSERT_TRUE(Call(*env, *runnable.GetObject(), "hashCode", "()I").IsInt());
    ASSERT_FALSE(env->ExceptionCheck());
}

TEST(JVM, ProxyComparator) {
    REQUIRE_JVM();
    auto & vm = JvmEnvironment::GetVM();
    auto env = vm.GetEnv();
    auto list = MakeList(*env, { 3, 1, 2 });
    JProxy reversed(vm, "java.util.Comparator", { { "compare", [](ENV &, const std::vector<Value> & args) -> Value {
        return (int)(args[1].AsInt() - args[0].AsInt());
    } } });
    StaticCall(*env, "java/util/Collections", "sort", "(Ljava/util/List;Ljava/util/Comparator;)V", { list, reversed.GetObject() });
    ASSERT_EQ(CollectionToVector(*env, *list), (std::vector<Value>{ 3, 2, 1 }));
}

TEST(JVM, ProxyFailuresReachJava) {
    REQUIRE_JVM();
    auto & vm = JvmEnvironment::GetVM();
    auto env = vm.GetEnv();
    JProxy failing(vm, "java.util.concurrent.Callable", { { "call", [](ENV &, const std::vector<Value> &) -> Value {
        throw TypeError("no result");
    } } });
    try {
        Call(*env, *failing.GetObject(), "call", "()Ljava/lang/Object;");
        FAIL() << "call succeeded";
    } catch(const JavaException & ex) {
        ASSERT_EQ(ex.GetClassName(), "java.lang.Error");
        ASSERT_NE(ex.GetMessage().find("no result"), std::string::npos);
    }

    // A java exception keeps its class
    JProxy parsing(vm, "java.util.concurrent.Callable", { { "call", [](ENV & callbackEnv, const std::vector<Value> &) -> Value {
        return StaticCall(callbackEnv, "java/lang/Integer", "parseInt", "(Ljava/lang/String;)I", { "x" });
    } } });
    try {
        Call(*env, *parsing.GetObject(), "call", "()Ljava/lang/Object;");
        FAIL() << "call succeeded";
    } catch(const JavaException & ex) {
        ASSERT_EQ(ex.GetClassName(), "java.lang.NumberFormatException");
    }

    JProxy empty(vm, "java.lang.Runnable", {});
    ASSERT_THROW(Call(*env, *empty.GetObject(), "run", "()V"), JavaException);

    std::shared_ptr<Object> orphan;
    {
        JProxy temporary(vm, "java.lang.Runnable", { { "run", [](ENV &, const std::vector<Value> &) -> Value {
            return nullptr;
        } } });
        orphan = temporary.GetObject();
        Call(*env, *orphan, "run", "()V");
    }
    ASSERT_THROW(Call(*env, *orphan, "run", "()V"), JavaException);
    ASSERT_FALSE(env->ExceptionCheck());
}

TEST(JVM, EnumerationsAndDictionaries) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto letters = MakeList(*env, { "a", "b" });
    auto enumeration = StaticCall(*env, "java/util/Collections", "enumeration", "(Ljava/util/Collection;)Ljava/util/Enumeration;", { letters });
    ASSERT_EQ(EnumerationToStrings(*env, *enumeration.AsObject()), (std::vector<std::string>{ "a", "b" }));
    auto numbers = StaticCall(*env, "java/util/Collections", "enumeration", "(Ljava/util/Collection;)Ljava/util/Enumeration;", { MakeList(*env, { 1, 2 }) });
    std::vector<Value> values;
    IterateEnumeration(*env, *numbers.AsObject(), [&values](const Value & v) {
        values.push_back(v);
    });
    ASSERT_EQ(values, (std::vector<Value>{ 1, 2 }));
    ASSERT_THROW(EnumerationToStrings(*env, *letters), JavaError);

    auto table = MakeInstance(*env, "java/util/Hashtable", "()V");
    Call(*env, *table, "put", "(Ljava/lang/Object;Ljava/lang/Object;)Ljava/lang/Object;", { "k", 1 });
    Call(*env, *table, "put", "(Ljava/lang/Object;Ljava/lang/Object;)Ljava/lang/Object;", { "l", "v" });
    std::map<std::string, std::string> expected = { { "k", "1" }, { "l", "v" } };
    ASSERT_EQ(DictionaryToStringMap(*env, *table), expected);
    auto properties = StaticCall(*env, "java/lang/System", "getProperties", "()Ljava/util/Properties;");
    ASSERT_EQ(DictionaryToStringMap(*env, *properties.AsObject()).count("java.version"), 1);
    ASSERT_THROW(DictionaryToStringMap(*env, *letters), JavaError);
}

TEST(JVM, StackTraces) {
    REQUIRE_JVM();
    auto env = JvmEnvironment::GetVM().GetEnv();
    auto traces = GetAllStackTraces(*env);
    ASSERT_FALSE(traces.empty());
    ASSERT_TRUE(std::any_of(traces.begin(), traces.end(), [](const ThreadStackTrace & trace) {
        return !trace.threadName.empty() && !trace.frames.empty();
    }));
    PrintAllStackTraces(*env);
}
