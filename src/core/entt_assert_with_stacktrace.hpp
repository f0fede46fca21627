#ifndef TETRYS_CORE_ENTT_ASSERT_WITH_STACKTRACE_HPP
#define TETRYS_CORE_ENTT_ASSERT_WITH_STACKTRACE_HPP

// entt/entt.hpp より先に include すること(ENTT_ASSERT の差し替え)

#include <SDL2/SDL_log.h>

#include <boost/stacktrace.hpp>
#include <cstdlib>
#include <sstream>

namespace tetrys::detail {

[[noreturn]] inline void entt_assert_handler(const char* msg, const char* expr, const char* file,
                                             int line) {
    std::ostringstream trace;
    trace << boost::stacktrace::stacktrace();

    SDL_LogCritical(SDL_LOG_CATEGORY_ASSERT,
                    "ENTT_ASSERT failed: %s\n  expr : %s\n  file : %s:%d\nStacktrace:\n%s",
                    msg ? msg : "", expr, file, line, trace.str().c_str());

    std::abort();
}

}  // namespace tetrys::detail

// 条件式の形にしておくと constexpr 文脈でも成立時は評価されない
#define ENTT_ASSERT(condition, msg) \
    ((condition) ? void(0)          \
                 : ::tetrys::detail::entt_assert_handler((msg), #condition, __FILE__, __LINE__))

#endif /* TETRYS_CORE_ENTT_ASSERT_WITH_STACKTRACE_HPP */
