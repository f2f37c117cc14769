#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef CADAVAE_UTIL_HH_
#define CADAVAE_UTIL_HH_

namespace cadavae {

/// Raised on configuration mismatch and numerical failure
struct fatal_error : public std::runtime_error {
    explicit fatal_error(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

} // namespace

std::string
curr_time()
{
    std::time_t rawtime;
    std::time(&rawtime);
    char buf[80];
    std::strftime(buf, sizeof(buf), "%c", std::localtime(&rawtime));
    return std::string(buf);
}

#define TLOG(msg)                                                    \
    {                                                                \
        std::cerr << "[" << curr_time() << "] " << msg << std::endl; \
    }

#define WLOG(msg)                                                          \
    {                                                                      \
        std::cerr << "[" << curr_time() << "] [Warning] " << msg           \
                  << std::endl;                                            \
    }

#define ELOG(msg)                                                          \
    {                                                                      \
        std::cerr << "[" << curr_time() << "] [Error  ] " << msg           \
                  << std::endl;                                            \
    }

#define ASSERT(cond, msg)                             \
    {                                                 \
        if (!(cond)) {                                \
            std::ostringstream _ss;                   \
            _ss << msg;                               \
            ELOG(_ss.str());                          \
            throw cadavae::fatal_error(_ss.str());    \
        }                                             \
    }

#define CHK(cond)                                                  \
    {                                                              \
        if ((cond) != EXIT_SUCCESS) {                              \
            ELOG("[" << __FILE__ << ":" << __LINE__ << "] " #cond); \
            throw cadavae::fatal_error("failed: " #cond);          \
        }                                                          \
    }

#define ERR_RET(cond, msg)      \
    {                           \
        if (cond) {             \
            ELOG(msg);          \
            return EXIT_FAILURE; \
        }                       \
    }

/// zero-padded tag for the iteration (e.g., 007 out of 100)
std::string
zeropad(const int64_t t, const int64_t tmax)
{
    std::ostringstream ss;
    const int64_t ndigit = std::to_string(std::max(tmax, t)).size();
    ss << std::setw(ndigit) << std::setfill('0') << t;
    return ss.str();
}

template <typename T>
struct check_positive_t {
    explicit check_positive_t(const T v)
        : val(v)
    {
        ASSERT(val > 0, "must be positive: " << val);
    }
    const T val;
};

#endif
