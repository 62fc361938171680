#include "console.hh"
#ifdef __EMSCRIPTEN__
#include <emscripten.h>
#else
#include <iostream>
#endif

namespace sigrun::console {

void (*sink)(Level, const std::string&) = nullptr;

#ifdef __EMSCRIPTEN__
#define DEF_LOGGER(key)                                                        \
    void key(const std::string& s)                                             \
    {                                                                          \
        if (sink) {                                                            \
            (*sink)(Level::key, s);                                            \
            return;                                                            \
        }                                                                      \
        EM_ASM_INT({ console.key(UTF8ToString($0)); }, s.c_str());             \
    }
#else
#define DEF_LOGGER(key)                                                        \
    void key(const std::string& s)                                             \
    {                                                                          \
        if (sink) {                                                            \
            (*sink)(Level::key, s);                                            \
            return;                                                            \
        }                                                                      \
        std::clog << "sigrun " #key ": " << s << std::endl;                   \
    }
#endif

DEF_LOGGER(log)
DEF_LOGGER(warn)
DEF_LOGGER(error)
}
