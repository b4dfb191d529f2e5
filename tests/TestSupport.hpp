#pragma once

#include "fsremote/core/DeviceTypes.hpp"
#include "fsremote/core/Error.hpp"
#include "fsremote/log/Log.hpp"

#include <ostream>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { fsremote::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { fsremote::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace fsremote {
inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) { return os << toString(kind); }
namespace core {
inline std::ostream& operator<<(std::ostream& os, SessionState state) { return os << toString(state); }
} // namespace core
} // namespace fsremote

inline int finishTests(const char* suite) {
    if (g_failures) {
        fsremote::logError("Tests failed: ", suite, " ", g_failures, " failure(s)\n");
        return 1;
    }
    fsremote::setLogLevel(fsremote::LogLevel::Info);
    fsremote::logInfo(suite, " tests passed.\n");
    return 0;
}
