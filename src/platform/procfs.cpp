#include "hostpulse/procfs.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace hostpulse::procfs {

ReaderError read_file(const std::string& path, std::string& out) {
    errno = 0;
    std::ifstream file(path);
    if (!file.is_open()) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            return ReaderError::PermissionDenied;
        }
        return ReaderError::Unavailable;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    out = contents.str();
    return ReaderError::None;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string read_attribute(const std::string& path) {
    std::ifstream file(path);
    std::string line;
    if (!file.is_open() || !std::getline(file, line)) {
        return "";
    }
    return trim(line);
}

std::vector<CpuTimes> parse_cpu_times(const std::string& proc_stat) {
    std::vector<CpuTimes> times;
    std::istringstream stream(proc_stat);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.compare(0, 3, "cpu") != 0) {
            // The cpu block is contiguous at the top of the file
            if (!times.empty()) break;
            continue;
        }

        std::istringstream iss(line);
        std::string label;
        iss >> label;

        // user nice system idle iowait irq softirq steal; older kernels stop early
        uint64_t fields[8] = {};
        int count = 0;
        while (count < 8 && (iss >> fields[count])) {
            ++count;
        }
        if (count < 4) {
            continue;
        }

        CpuTimes cpu;
        for (int i = 0; i < count; ++i) {
            cpu.total += fields[i];
        }
        cpu.idle = fields[3] + fields[4];
        times.push_back(cpu);
    }

    return times;
}

double busy_percent(const CpuTimes& previous, const CpuTimes& current) {
    if (current.total <= previous.total) {
        return 0.0;
    }
    uint64_t total_diff = current.total - previous.total;
    uint64_t idle_diff = current.idle >= previous.idle ? current.idle - previous.idle : 0;
    if (idle_diff > total_diff) {
        idle_diff = total_diff;
    }
    return 100.0 * (1.0 - static_cast<double>(idle_diff) / static_cast<double>(total_diff));
}

std::string parse_cpu_model(const std::string& cpuinfo) {
    std::istringstream stream(cpuinfo);
    std::string line;

    while (std::getline(stream, line)) {
        // x86 uses "model name", some ARM kernels only provide "Hardware" or "Processor"
        if (line.rfind("model name", 0) == 0 || line.rfind("Hardware", 0) == 0 ||
            line.rfind("Processor", 0) == 0) {
            size_t colon_pos = line.find(':');
            if (colon_pos != std::string::npos) {
                std::string model = trim(line.substr(colon_pos + 1));
                if (!model.empty()) {
                    return model;
                }
            }
        }
    }
    return "Unknown CPU";
}

std::optional<MemoryReading> parse_meminfo(const std::string& meminfo) {
    std::istringstream stream(meminfo);
    std::string line;

    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    uint64_t free_kb = 0;
    uint64_t buffers_kb = 0;
    uint64_t cached_kb = 0;
    bool have_available = false;

    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            total_kb = value;
        } else if (key == "MemAvailable:") {
            available_kb = value;
            have_available = true;
        } else if (key == "MemFree:") {
            free_kb = value;
        } else if (key == "Buffers:") {
            buffers_kb = value;
        } else if (key == "Cached:") {
            cached_kb = value;
        }
    }

    if (total_kb == 0) {
        return std::nullopt;
    }

    MemoryReading reading;
    reading.total_bytes = total_kb * 1024;
    reading.available_bytes = (have_available ? available_kb : free_kb + buffers_kb + cached_kb) * 1024;
    return reading;
}

std::vector<NetDevCounters> parse_net_dev(const std::string& net_dev) {
    std::vector<NetDevCounters> counters;
    std::istringstream stream(net_dev);
    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        if (++line_no <= 2) continue; // headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        NetDevCounters entry;
        entry.name = trim(line.substr(0, colon));
        if (entry.name.empty()) continue;

        // rx bytes is the 1st field, tx bytes the 9th
        std::istringstream iss(line.substr(colon + 1));
        uint64_t skip = 0;
        iss >> entry.received_bytes;
        for (int i = 0; i < 7; ++i) iss >> skip;
        iss >> entry.transmitted_bytes;
        if (iss.fail()) continue;

        counters.push_back(std::move(entry));
    }

    return counters;
}

bool is_null_mac(const std::string& mac) {
    for (char c : mac) {
        if (c != '0' && c != ':') {
            return false;
        }
    }
    return true;
}

// /proc/mounts escapes space, tab, newline and backslash as \ooo
static std::string unescape_mount_field(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            std::isdigit(static_cast<unsigned char>(field[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 3]))) {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
            out.push_back(static_cast<char>(value));
            i += 3;
        } else {
            out.push_back(field[i]);
        }
    }
    return out;
}

std::vector<MountEntry> parse_mounts(const std::string& mounts) {
    std::vector<MountEntry> entries;
    std::istringstream stream(mounts);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        MountEntry entry;
        if (!(iss >> entry.device >> entry.mount_point >> entry.fs_type)) {
            continue;
        }
        entry.mount_point = unescape_mount_field(entry.mount_point);
        entries.push_back(std::move(entry));
    }

    return entries;
}

bool is_pseudo_filesystem(const std::string& fs_type) {
    static const std::unordered_set<std::string> pseudo = {
        "proc", "sysfs", "devtmpfs", "devpts", "tmpfs", "cgroup", "cgroup2", "pstore",
        "securityfs", "bpf", "autofs", "mqueue", "hugetlbfs", "configfs", "debugfs",
        "tracefs", "nsfs", "ramfs", "fusectl", "fuse.portal", "overlay", "squashfs",
        "binfmt_misc", "efivarfs", "rpc_pipefs", "selinuxfs", "fuse.gvfsd-fuse"
    };
    return pseudo.count(fs_type) != 0;
}

std::optional<PidStat> parse_pid_stat(const std::string& stat) {
    // comm may itself contain spaces and parentheses, so anchor on the last ')'
    size_t lp = stat.find('(');
    size_t rp = stat.rfind(')');
    if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > stat.size()) {
        return std::nullopt;
    }

    PidStat result;
    {
        std::istringstream pid_stream(stat.substr(0, lp));
        pid_stream >> result.pid;
        if (pid_stream.fail()) {
            return std::nullopt;
        }
    }
    result.comm = stat.substr(lp + 1, rp - lp - 1);

    // Fields after the comm start at field 3 (state); utime is 14, stime 15, rss 24
    std::istringstream iss(stat.substr(rp + 2));
    std::string field;
    for (int index = 3; index <= 24 && (iss >> field); ++index) {
        if (index == 14) {
            result.utime = std::strtoull(field.c_str(), nullptr, 10);
        } else if (index == 15) {
            result.stime = std::strtoull(field.c_str(), nullptr, 10);
        } else if (index == 24) {
            result.rss_pages = std::strtoll(field.c_str(), nullptr, 10);
            return result;
        }
    }

    return std::nullopt;
}

std::optional<uint64_t> parse_uptime(const std::string& uptime) {
    std::istringstream iss(uptime);
    double seconds = 0.0;
    if (!(iss >> seconds) || seconds < 0.0 || !std::isfinite(seconds)) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(seconds);
}

std::string parse_os_release_name(const std::string& os_release) {
    std::istringstream stream(os_release);
    std::string line;
    std::string name;

    while (std::getline(stream, line)) {
        std::string value;
        if (line.rfind("PRETTY_NAME=", 0) == 0) {
            value = line.substr(12);
        } else if (line.rfind("NAME=", 0) == 0 && name.empty()) {
            value = line.substr(5);
        } else {
            continue;
        }

        value = trim(value);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (line.rfind("PRETTY_NAME=", 0) == 0) {
            return value;
        }
        name = value;
    }

    return name;
}

} // namespace hostpulse::procfs
