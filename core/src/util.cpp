#include "execq/util.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace execq {

int64_t now_ms() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t steady_ms() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

std::string iso8601_utc(int64_t epoch_ms) {
    std::time_t t = (std::time_t)(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setw(3) << std::setfill('0') << (epoch_ms % 1000) << "Z";
    return oss.str();
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoi(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* e = std::getenv(k);
    if (!e || !*e) return defv;
    return e;
}

bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v) return defv;
    std::string s = lower_ascii(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

void set_env_if_missing(const char* key, const std::string& value) {
    // overwrite=0: an operator-provided value always wins
    (void)setenv(key, value.c_str(), 0);
}

std::string slurp_file(const std::filesystem::path& p) {
    std::ifstream f(p.string(), std::ios::binary);
    if (!f) return "";
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    std::filesystem::create_directories(dst.parent_path(), ec);
    if (ec) return "create_directories: " + ec.message();

    // Unique temp name per writer so concurrent processes never share one.
    auto tmp = dst;
    tmp += ".tmp." + std::to_string(::getpid()) + "." +
           std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);
    size_t off = 0;
    while (off < body.size()) {
        ssize_t w = ::write(fd, body.data() + off, body.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            std::filesystem::remove(tmp, ec);
            return err;
        }
        off += (size_t)w;
    }
    ::close(fd);

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::string err = "rename: " + ec.message();
        std::filesystem::remove(tmp, ec);
        return err;
    }
    return "";
}

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

} // namespace execq
