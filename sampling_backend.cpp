#include <iostream>
#include <string>
#include <utility>

#include <errno.h>
#include <string.h>
#include <poll.h>
#include <time.h>
#include <unistd.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>

#include "sampling_backend.hpp"

using std::string;
using std::to_string;
using std::move;

static string errno_message(const char* call) {
    int errno_copy = errno;
    return string(call) + " failed with errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy);
}

Status FallbackBackend::run(std::chrono::microseconds interval, const TickFn& tick) {
    while (true) {
        auto start = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (halted) {
                break;
            }
        }

        if (!tick()) {
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        auto to_sleep = interval - std::chrono::duration_cast<std::chrono::microseconds>(elapsed);

        std::unique_lock<std::mutex> lock(mutex);
        if (to_sleep.count() > 0) {
            cv.wait_for(lock, to_sleep, [this] { return halted; });
        }
        if (halted) {
            break;
        }
    }
    return ResultInit::ok();
}

void FallbackBackend::halt() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        halted = true;
    }
    cv.notify_all();
}

Result<std::unique_ptr<TimerfdBackend>, string> TimerfdBackend::create() {
    int timer_fd = timerfd_create(CLOCK_MONOTONIC, TFD_CLOEXEC);
    if (timer_fd < 0) {
        return ResultInit::err(errno_message("timerfd_create()"));
    }

    int wake_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd < 0) {
        string message = errno_message("eventfd()");
        close(timer_fd);
        return ResultInit::err(move(message));
    }

    return ResultInit::ok(std::unique_ptr<TimerfdBackend>(new TimerfdBackend(timer_fd, wake_fd)));
}

TimerfdBackend::~TimerfdBackend() {
    close(timer_fd);
    close(wake_fd);
}

Status TimerfdBackend::run(std::chrono::microseconds interval, const TickFn& tick) {
    struct timespec now;
    if (clock_gettime(CLOCK_MONOTONIC, &now) != 0) {
        return ResultInit::err(errno_message("clock_gettime()"));
    }

    long long interval_ns = (long long) interval.count() * 1000;
    struct itimerspec spec {};
    spec.it_interval.tv_sec = interval_ns / 1000000000;
    spec.it_interval.tv_nsec = interval_ns % 1000000000;

    long long first_ns = (long long) now.tv_nsec + interval_ns;
    spec.it_value.tv_sec = now.tv_sec + first_ns / 1000000000;
    spec.it_value.tv_nsec = first_ns % 1000000000;

    if (timerfd_settime(timer_fd, TFD_TIMER_ABSTIME, &spec, nullptr) != 0) {
        return ResultInit::err(errno_message("timerfd_settime()"));
    }

    while (!halted.load(std::memory_order_acquire)) {
        struct pollfd fds[2];
        fds[0] = pollfd { timer_fd, POLLIN, 0 };
        fds[1] = pollfd { wake_fd, POLLIN, 0 };

        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ResultInit::err(errno_message("poll()"));
        }

        if (fds[1].revents & POLLIN) {
            break;
        }

        if (fds[0].revents & POLLIN) {
            // overruns collapse into a single tick
            uint64_t expirations = 0;
            ssize_t n = read(timer_fd, &expirations, sizeof(expirations));
            if (n != (ssize_t) sizeof(expirations)) {
                if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
                    continue;
                }
                return ResultInit::err(errno_message("read(timerfd)"));
            }

            if (!tick()) {
                break;
            }
        }
    }

    struct itimerspec disarm {};
    if (timerfd_settime(timer_fd, 0, &disarm, nullptr) != 0) {
        return ResultInit::err(errno_message("timerfd_settime(disarm)"));
    }
    return ResultInit::ok();
}

void TimerfdBackend::halt() {
    halted.store(true, std::memory_order_release);
    uint64_t one = 1;
    if (write(wake_fd, &one, sizeof(one)) != (ssize_t) sizeof(one) && errno != EAGAIN) {
        std::cerr << errno_message("write(eventfd)") << "\n";
    }
}

std::unique_ptr<SamplingBackend> make_sampling_backend(bool force_fallback, bool verbose) {
    if (!force_fallback) {
        auto native = TimerfdBackend::create();
        if (native.isOk()) {
            return move(native).getOkRef();
        }
        if (verbose) {
            std::cerr << "Native sampling backend unavailable, using fallback: " << native.getErrRef() << "\n";
        }
    }
    return std::make_unique<FallbackBackend>();
}
