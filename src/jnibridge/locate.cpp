#include <jnibridge/locate.h>
#include <jnibridge/throwable.h>
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>

using namespace jnibridge;

static bool IsFile(const std::string & path) {
    struct stat st;
    return stat(path.data(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string jnibridge::FindJavaHome() {
    auto home = getenv("JAVA_HOME");
    return home ? home : "";
}

std::string jnibridge::FindJvmLibrary(const std::string &javaHome) {
    if(javaHome.empty()) {
        throw JVMNotFoundError();
    }
    // jdk 9+ dropped the arch directory and the jre subdirectory
    for(auto&& jreHome : { javaHome, javaHome + "/jre", javaHome + "/default-java" }) {
        for(auto&& arch : { "/lib/amd64", "/lib/i386", "/lib" }) {
            for(auto&& flavor : { "/client", "/server" }) {
                auto path = jreHome + arch + flavor + "/libjvm.so";
                if(IsFile(path)) {
                    return path;
                }
            }
        }
    }
    throw JVMNotFoundError();
}

std::string jnibridge::FindJvmLibrary() {
    return FindJvmLibrary(FindJavaHome());
}

std::vector<std::string> jnibridge::DefaultClassPath() {
    std::vector<std::string> result;
    auto classpath = getenv("CLASSPATH");
    if(!classpath) {
        return result;
    }
    std::istringstream ss(classpath);
    std::string entry;
    while(std::getline(ss, entry, ':')) {
        if(!entry.empty()) {
            result.push_back(entry);
        }
    }
    return result;
}
