#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <string>
#include <fstream>
#include <cstdlib>

namespace test_helpers {

// Write string to file
inline bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return file.good();
}

// Set or override an environment variable for one scope (RAII wrapper)
// Restores the previous value, or unsets it, on destruction
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value)
        : name_(name) {
        const char* old = getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnv() {
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_ = false;
};

} // namespace test_helpers

#endif // TEST_HELPERS_H
