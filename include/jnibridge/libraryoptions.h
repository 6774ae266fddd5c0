#pragma once

namespace jnibridge {
    // Dynamic loader used to open the jvm shared library
    struct LibraryOptions {
        void *(*dlopen)(const char *, int);
        void *(*dlsym)(void *handle, const char *);
        int (*dlclose)(void *);
        LibraryOptions(void *(*dlopen)(const char *, int), void *(*dlsym)(void *handle, const char *), int (*dlclose)(void *));
        // Uses the dynamic loader of the host system
        LibraryOptions();
    };
}
