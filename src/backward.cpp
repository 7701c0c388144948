// Crash traces: with CRONTICK_USE_BACKWARD, backward-cpp's signal handler prints a
// stack trace when the process dies on SIGSEGV, SIGABRT and friends.

#if defined(CRONTICK_USE_BACKWARD) && CRONTICK_USE_BACKWARD
#include <backward.hpp>

namespace backward {
backward::SignalHandling sh;
} // namespace backward
#endif
