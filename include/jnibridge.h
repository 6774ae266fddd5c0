#pragma once
#include "jnibridge/throwable.h"
#include "jnibridge/object.h"
#include "jnibridge/value.h"
#include "jnibridge/env.h"
#include "jnibridge/vm.h"
#include "jnibridge/util.h"
#include "jnibridge/wrappers.h"
#include "jnibridge/refregistry.h"
#include "jnibridge/proxy.h"
