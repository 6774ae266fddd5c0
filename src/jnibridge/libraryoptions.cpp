#include <jnibridge/libraryoptions.h>
#include <dlfcn.h>

jnibridge::LibraryOptions::LibraryOptions(void *(*dlopen)(const char *, int), void *(*dlsym)(void *handle, const char *), int (*dlclose)(void *)) : dlopen(dlopen), dlsym(dlsym), dlclose(dlclose) {
}

jnibridge::LibraryOptions::LibraryOptions() : LibraryOptions(::dlopen, ::dlsym, ::dlclose) {
}
