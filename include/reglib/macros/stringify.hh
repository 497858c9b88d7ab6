#pragma once

#define REGLIST_STRINGIFY_IMPL(x) #x
#define REGLIST_STRINGIFY(x) REGLIST_STRINGIFY_IMPL(x)
