#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "hostpulse/procfs.hpp"

namespace procfs = hostpulse::procfs;

TEST_CASE("parse_cpu_times reads aggregate and per-core lines", "[procfs]") {
    const char* stat =
        "cpu  100 0 100 700 100 0 0 0 0 0\n"
        "cpu0 50 0 50 350 50 0 0 0 0 0\n"
        "cpu1 50 0 50 350 50 0 0 0 0 0\n"
        "intr 12345 0 0\n"
        "ctxt 999\n";

    auto times = procfs::parse_cpu_times(stat);
    REQUIRE(times.size() == 3);
    REQUIRE(times[0].total == 1000);
    REQUIRE(times[0].idle == 800);
    REQUIRE(times[1].total == 500);
}

TEST_CASE("busy_percent compares two samples", "[procfs]") {
    procfs::CpuTimes before{1000, 800};
    procfs::CpuTimes after{2000, 1300};
    REQUIRE(procfs::busy_percent(before, after) == Catch::Approx(50.0));

    SECTION("No elapsed ticks") {
        REQUIRE(procfs::busy_percent(after, after) == 0.0);
    }

    SECTION("Counters went backwards") {
        REQUIRE(procfs::busy_percent(after, before) == 0.0);
    }
}

TEST_CASE("parse_cpu_model finds the model name", "[procfs]") {
    const char* cpuinfo =
        "processor\t: 0\n"
        "vendor_id\t: GenuineIntel\n"
        "model name\t: Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz\n";
    REQUIRE(procfs::parse_cpu_model(cpuinfo) == "Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz");
    REQUIRE(procfs::parse_cpu_model("processor\t: 0\n") == "Unknown CPU");
}

TEST_CASE("parse_meminfo converts kB to bytes", "[procfs]") {
    SECTION("Modern kernel") {
        auto memory = procfs::parse_meminfo(
            "MemTotal:       16000000 kB\n"
            "MemFree:         1000000 kB\n"
            "MemAvailable:    8000000 kB\n");
        REQUIRE(memory.has_value());
        REQUIRE(memory->total_bytes == 16000000ULL * 1024);
        REQUIRE(memory->available_bytes == 8000000ULL * 1024);
    }

    SECTION("No MemAvailable") {
        auto memory = procfs::parse_meminfo(
            "MemTotal:       4000 kB\n"
            "MemFree:        1000 kB\n"
            "Buffers:         200 kB\n"
            "Cached:          300 kB\n");
        REQUIRE(memory.has_value());
        REQUIRE(memory->available_bytes == 1500ULL * 1024);
    }

    SECTION("Garbage") {
        REQUIRE_FALSE(procfs::parse_meminfo("nothing here\n").has_value());
    }
}

TEST_CASE("parse_net_dev reads rx and tx byte counters", "[procfs]") {
    const char* net_dev =
        "Inter-|   Receive                                                |  Transmit\n"
        " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
        "    lo:    5000      50    0    0    0     0          0         0     5000      50    0    0    0     0       0          0\n"
        "  eth0:123456789  1000    0    0    0     0          0         0   987654     900    0    0    0     0       0          0\n";

    auto counters = procfs::parse_net_dev(net_dev);
    REQUIRE(counters.size() == 2);
    REQUIRE(counters[1].name == "eth0");
    REQUIRE(counters[1].received_bytes == 123456789);
    REQUIRE(counters[1].transmitted_bytes == 987654);
}

TEST_CASE("is_null_mac recognizes loopback addresses", "[procfs]") {
    REQUIRE(procfs::is_null_mac("00:00:00:00:00:00"));
    REQUIRE(procfs::is_null_mac(""));
    REQUIRE_FALSE(procfs::is_null_mac("52:54:00:12:34:56"));
}

TEST_CASE("parse_mounts unescapes mount points", "[procfs]") {
    const char* mounts =
        "/dev/nvme0n1p2 / ext4 rw,relatime 0 0\n"
        "proc /proc proc rw,nosuid 0 0\n"
        "/dev/sdb1 /media/usb\\040stick vfat rw 0 0\n";

    auto entries = procfs::parse_mounts(mounts);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].device == "/dev/nvme0n1p2");
    REQUIRE(entries[0].fs_type == "ext4");
    REQUIRE(entries[2].mount_point == "/media/usb stick");

    REQUIRE(procfs::is_pseudo_filesystem("proc"));
    REQUIRE(procfs::is_pseudo_filesystem("tmpfs"));
    REQUIRE_FALSE(procfs::is_pseudo_filesystem("ext4"));
}

TEST_CASE("parse_pid_stat handles names with spaces and parentheses", "[procfs]") {
    const char* stat =
        "4242 (Web Content (x)) S 1 4242 4242 0 -1 4194560 1000 0 0 0 "
        "350 120 0 0 20 0 30 0 5000 800000000 2048 18446744073709551615";

    auto parsed = procfs::parse_pid_stat(stat);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->pid == 4242);
    REQUIRE(parsed->comm == "Web Content (x)");
    REQUIRE(parsed->utime == 350);
    REQUIRE(parsed->stime == 120);
    REQUIRE(parsed->rss_pages == 2048);

    REQUIRE_FALSE(procfs::parse_pid_stat("4242 (truncated").has_value());
    REQUIRE_FALSE(procfs::parse_pid_stat("4242 (short) S 1 2 3").has_value());
}

TEST_CASE("parse_uptime and parse_os_release_name", "[procfs]") {
    REQUIRE(procfs::parse_uptime("35123.45 120000.00\n") == 35123u);
    REQUIRE_FALSE(procfs::parse_uptime("").has_value());

    const char* os_release =
        "NAME=\"Ubuntu\"\n"
        "VERSION_ID=\"24.04\"\n"
        "PRETTY_NAME=\"Ubuntu 24.04.1 LTS\"\n";
    REQUIRE(procfs::parse_os_release_name(os_release) == "Ubuntu 24.04.1 LTS");
    REQUIRE(procfs::parse_os_release_name("NAME=Alpine\n") == "Alpine");
}
