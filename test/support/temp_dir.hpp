/***
 * Name: temp_dir
 * Purpose: Scratch directory for one test, removed with everything in it.
 */
#ifndef scriptdeck_TEST_SUPPORT_TEMP_DIR_HPP
#define scriptdeck_TEST_SUPPORT_TEMP_DIR_HPP

#include <scriptdeck/core/utils.hpp>
#include <cstdlib>
#include <string>
#include <vector>

namespace scriptdeck {
namespace testing {

class TempDir {
public:
    TempDir() {
        std::string pattern = "/tmp/scriptdeck-test-XXXXXX";
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (mkdtemp(&buf[0])) {
            path_ = &buf[0];
        }
    }
    ~TempDir() {
        if (!path_.empty()) remove_tree(path_);
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return join_path(path_, name); }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    std::string path_;
};

} // namespace testing
} // namespace scriptdeck

#endif // scriptdeck_TEST_SUPPORT_TEMP_DIR_HPP
