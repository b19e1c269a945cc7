#include "common/io_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"

namespace pyexec {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

bool create_file_exclusive(const filesystem::path &path, const string &content, mode_t mode) {
    int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, mode);
    if (fd < 0) {
        if (errno == EEXIST) return false;
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    }
    defer {
        close(fd);
    };

    // 写入失败时删除半成品文件，调用方不会拿到这个路径
    auto fail = [&](const char *what) {
        int err = errno;
        unlink(path.c_str());
        throw system_error(err, system_category(), string(what) + " " + path.string());
    };

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("unable to write file");
        }
        written += n;
    }
    // umask 可能屏蔽了部分权限位
    if (fchmod(fd, mode) != 0)
        fail("unable to chmod file");
    return true;
}

}  // namespace pyexec
