#pragma once
#include <cstdio>

#define LOG(tag, fmt, ...) fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__)
