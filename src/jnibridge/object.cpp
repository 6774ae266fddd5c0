#include <jnibridge/object.h>
#include <jnibridge/env.h>
#include <jnibridge/reaper.h>
#include <jnibridge/signature.h>

using namespace jnibridge;

Object::Object(jobject handle, std::shared_ptr<Reaper> reaper) : handle(handle), reaper(std::move(reaper)) {
}

Object::Object(jobject handle) : handle(handle) {
}

Object::~Object() {
    Release();
}

void Object::Release() {
    auto ref = handle.exchange(nullptr);
    if(ref && reaper) {
        reaper->Release(ref);
    }
}

std::string Class::GetName(ENV &env) const {
    auto jenv = env.GetJNIEnv();
    LocalFrame frame(jenv, 4);
    auto classclass = jenv->FindClass("java/lang/Class");
    env.ThrowIfPending();
    auto getName = jenv->GetMethodID(classclass, "getName", "()Ljava/lang/String;");
    env.ThrowIfPending();
    auto name = (jstring)jenv->CallObjectMethodA(GetHandle(), getName, nullptr);
    env.ThrowIfPending();
    Object str(name);
    return env.GetStringUTF(str);
}

std::string Class::GetSignature(ENV &env) const {
    // Array classes are already named by their signature, e.g. [Ljava.lang.String;
    auto name = GetName(env);
    if(name == "boolean") return "Z";
    if(name == "byte") return "B";
    if(name == "char") return "C";
    if(name == "short") return "S";
    if(name == "int") return "I";
    if(name == "long") return "J";
    if(name == "float") return "F";
    if(name == "double") return "D";
    if(name == "void") return "V";
    if(!name.empty() && name[0] == '[') {
        return ToSlashedName(name);
    }
    return "L" + ToSlashedName(name) + ";";
}
