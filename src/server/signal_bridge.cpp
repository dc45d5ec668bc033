#include "signal_bridge.h"
#include "logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

int SignalBridge::s_fds[2] = {-1, -1};

SignalBridge::SignalBridge(QObject* parent)
    : QObject(parent)
{
}

SignalBridge::~SignalBridge()
{
    if (notifier_) {
        notifier_->setEnabled(false);
    }
}

bool SignalBridge::install(std::initializer_list<int> signos)
{
    if (s_fds[0] < 0) {
        if (::pipe(s_fds) != 0) {
            Logger::instance().error(std::string("signal pipe: ") + std::strerror(errno));
            return false;
        }
        for (int fd : s_fds) {
            ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
            ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
    }
    if (!notifier_) {
        notifier_ = new QSocketNotifier(s_fds[0], QSocketNotifier::Read, this);
        connect(notifier_, &QSocketNotifier::activated, this, &SignalBridge::onReadable);
    }

    for (int signo : signos) {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = &SignalBridge::handle;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        if (::sigaction(signo, &sa, nullptr) != 0) {
            Logger::instance().error("cannot install handler for signal " + std::to_string(signo)
                + ": " + std::strerror(errno));
            return false;
        }
    }
    return true;
}

void SignalBridge::handle(int signo)
{
    const int saved = errno;
    const unsigned char byte = static_cast<unsigned char>(signo);
    // A full pipe already holds a pending wakeup.
    ssize_t ignored = ::write(s_fds[1], &byte, 1);
    (void)ignored;
    errno = saved;
}

void SignalBridge::onReadable()
{
    unsigned char buf[16];
    ssize_t n;
    while ((n = ::read(s_fds[0], buf, sizeof(buf))) > 0) {
        for (ssize_t i = 0; i < n; ++i) {
            Logger::instance().info("received signal " + std::to_string(buf[i]));
            emit signalReceived(static_cast<int>(buf[i]));
        }
    }
}
