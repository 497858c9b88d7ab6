#include <cstdio>
#include <exception>
#include <reglib/errmsg.hh>
#include <reglib/logger.hh>
#include <reglib/macros/throw.hh>
#include <reglib/time.hh>

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
Logger stdlog(stderr), errlog(stderr);

Logger::Logger(const char* filename)
: f_(fopen(filename, "ae"))
, opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(const char* filename) {
    FILE* f = fopen(filename, "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_.store(true);
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            try {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s\n",
                    mysql_localdate().c_str(),
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            } catch (const std::exception&) {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s\n",
                    static_cast<int>(buff_.size()),
                    buff_.data()
                );
            }
        } else {
            (void)fprintf(
                logger_.f_, "%.*s\n", static_cast<int>(buff_.size()), buff_.data()
            );
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
