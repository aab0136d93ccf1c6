#include "delivery/time_format.hpp"

#include <ctime>
#include <format>
#include <vector>

namespace flbkinesis {

std::string format_time(Timestamp tp, const std::string& format) {
    const auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);
    if (micros.count() < 0) {
        secs -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    // Substitute the sub-second extensions first; strftime never sees them
    std::string expanded;
    expanded.reserve(format.size() + 8);
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%' || i + 1 >= format.size()) {
            expanded += format[i];
            continue;
        }
        const char spec = format[i + 1];
        if (spec == 'L') {
            expanded += std::format("{:03d}", micros.count() / 1000);
        } else if (spec == 'f') {
            expanded += std::format("{:06d}", micros.count());
        } else {
            expanded += '%';
            expanded += spec;
        }
        ++i;
    }

    const std::time_t time = static_cast<std::time_t>(secs.count());
    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    if (expanded.empty()) return {};

    std::vector<char> buf(expanded.size() * 4 + 64);
    while (true) {
        const size_t written = std::strftime(buf.data(), buf.size(), expanded.c_str(), &tm_buf);
        if (written > 0) {
            return std::string(buf.data(), written);
        }
        // 0 is ambiguous (empty result or buffer too small); cap the growth
        if (buf.size() > 64 * 1024) {
            return {};
        }
        buf.resize(buf.size() * 2);
    }
}

} // namespace flbkinesis
