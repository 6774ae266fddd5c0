#pragma once
#include <string>
#include <vector>

namespace jnibridge {
    // Value of JAVA_HOME or an empty string
    std::string FindJavaHome();
    // Path of libjvm.so below javaHome, throws JVMNotFoundError
    std::string FindJvmLibrary(const std::string & javaHome);
    std::string FindJvmLibrary();
    // Entries of CLASSPATH
    std::vector<std::string> DefaultClassPath();
}
