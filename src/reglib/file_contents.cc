#include <cerrno>
#include <fcntl.h>
#include <reglib/errmsg.hh>
#include <reglib/file_contents.hh>
#include <reglib/macros/throw.hh>
#include <string>
#include <unistd.h>

std::string get_file_contents(const char* path) {
    int fd = open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        THROW("open('", path, "')", errmsg());
    }

    std::string res;
    char buff[1 << 14];
    for (;;) {
        ssize_t len = read(fd, buff, sizeof(buff));
        if (len == 0) {
            break;
        }
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            int errnum = errno;
            (void)close(fd);
            THROW("read('", path, "')", errmsg(errnum));
        }
        res.append(buff, static_cast<size_t>(len));
    }

    (void)close(fd);
    return res;
}
