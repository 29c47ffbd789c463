// src/power/sysfs_io.cpp
#include "power/sysfs_io.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace power {

bool read_trimmed(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_DEBUG("[sysfs] cannot open %s", path.c_str());
        return false;
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        LOG_DEBUG("[sysfs] read failed: %s", path.c_str());
        return false;
    }

    out = ss.str();
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' ||
                            out.back() == ' ' || out.back() == '\t')) {
        out.pop_back();
    }
    return true;
}

bool read_int64(const std::string& path, int64_t& out) {
    std::string buf;
    if (!read_trimmed(path, buf) || buf.empty()) return false;

    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(buf.c_str(), &end, 10);
    if (errno != 0 || end == buf.c_str() || *end != '\0') {
        LOG_DEBUG("[sysfs] not an integer in %s: '%s'", path.c_str(), buf.c_str());
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

bool write_line(const std::string& path, const std::string& value) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        LOG_ERROR("[sysfs] cannot open %s for writing: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    f << value << "\n";
    f.flush();
    if (!f.good()) {
        LOG_ERROR("[sysfs] write to %s failed", path.c_str());
        return false;
    }
    return true;
}

} // namespace power
