#ifndef FAKE_SYSFS_HPP
#define FAKE_SYSFS_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

/**
 * FakeSysfs - Temporary directory laid out like /sys/class/gpio
 *
 * export/unexport are plain files; the kernel would create gpioN on
 * export, so tests pre-create the pins they use with addPin().
 */
class FakeSysfs {
public:
    FakeSysfs() {
        char tmpl[] = "/tmp/homeio_sysfs_XXXXXX";
        const char *dir = mkdtemp(tmpl);
        if (dir) {
            m_root = dir;
            writeFile("export", "");
            writeFile("unexport", "");
        }
    }

    ~FakeSysfs() {
        if (!m_root.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(m_root, ec);
        }
    }

    FakeSysfs(const FakeSysfs &) = delete;
    FakeSysfs &operator=(const FakeSysfs &) = delete;

    bool valid() const { return !m_root.empty(); }
    const std::string &root() const { return m_root; }

    void addPin(int pin, int initial_value = 0) {
        std::string dir = "gpio" + std::to_string(pin);
        std::filesystem::create_directories(m_root + "/" + dir);
        writeFile(dir + "/direction", "in");
        writeFile(dir + "/value", initial_value ? "1\n" : "0\n");
    }

    std::string readFile(const std::string &rel) const {
        std::ifstream in(m_root + "/" + rel);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    void writeFile(const std::string &rel, const std::string &content) const {
        std::ofstream out(m_root + "/" + rel, std::ios::trunc);
        out << content;
    }

private:
    std::string m_root;
};

#endif // FAKE_SYSFS_HPP
