#ifndef LQA_XRAY_UTIL_H
#define LQA_XRAY_UTIL_H

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

#endif // LQA_XRAY_UTIL_H
