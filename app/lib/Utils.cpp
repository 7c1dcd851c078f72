#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace {
constexpr const char* kConfigDirEnv = "FILE_TAXONOMY_CONFIG_DIR";
constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::tm to_utc_tm(std::time_t value) {
    std::tm result{};
#if defined(_WIN32)
    gmtime_s(&result, &value);
#else
    gmtime_r(&value, &result);
#endif
    return result;
}

std::time_t utc_tm_to_time(std::tm& value) {
#if defined(_WIN32)
    return _mkgmtime(&value);
#else
    return timegm(&value);
#endif
}
} // namespace

namespace Utils {

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim_copy(std::string value) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string capitalize(std::string value) {
    if (!value.empty()) {
        value.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(value.front())));
    }
    return value;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string sanitize_path_label(const std::string& value) {
    static const std::string forbidden = R"(<>:"/\|?*)";
    std::string result;
    result.reserve(value.size());
    bool last_was_space = false;
    for (unsigned char ch : value) {
        if (std::iscntrl(ch) || forbidden.find(static_cast<char>(ch)) != std::string::npos) {
            continue;
        }
        if (std::isspace(ch)) {
            if (!last_was_space && !result.empty()) {
                result.push_back(' ');
            }
            last_was_space = true;
            continue;
        }
        result.push_back(static_cast<char>(ch));
        last_was_space = false;
    }
    return trim_copy(result);
}

bool is_valid_utf8(const std::string& value) {
    size_t i = 0;
    const size_t n = value.size();
    while (i < n) {
        const auto lead = static_cast<unsigned char>(value[i]);
        size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(value[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }
        // Overlong encodings, surrogates and out-of-range values.
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string fnv1a_hex(const std::string& value) {
    std::uint64_t hash = kFnvOffset;
    for (unsigned char ch : value) {
        hash ^= ch;
        hash *= kFnvPrime;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return oss.str();
}

std::string generate_id(const std::string& prefix) {
    static std::mutex generator_mutex;
    static std::mt19937_64 generator{std::random_device{}()};
    std::uint64_t high = 0;
    std::uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        high = generator();
        low = generator();
    }
    std::ostringstream oss;
    if (!prefix.empty()) {
        oss << prefix << '-';
    }
    oss << std::hex << std::setw(16) << std::setfill('0') << high
        << std::setw(16) << std::setfill('0') << low;
    return oss.str();
}

std::string format_timestamp(TimePoint time_point) {
    const std::time_t raw = Clock::to_time_t(time_point);
    const std::tm utc = to_utc_tm(raw);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<TimePoint> parse_timestamp(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::tm parsed{};
    std::istringstream iss(value);
    iss >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return Clock::from_time_t(utc_tm_to_time(parsed));
}

std::string default_config_dir() {
    if (const char* override_dir = std::getenv(kConfigDirEnv); override_dir && *override_dir) {
        return override_dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / "file-taxonomy").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".config" / "file-taxonomy").string();
    }
    return (std::filesystem::current_path() / ".file-taxonomy").string();
}

} // namespace Utils
