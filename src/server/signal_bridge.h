#pragma once

#include <QObject>
#include <QSocketNotifier>

#include <initializer_list>

/// Turns POSIX signals into a Qt signal on the event loop thread.
///
/// The handler only write()s the signal number into a pipe; a
/// QSocketNotifier on the read end emits signalReceived(). One bridge per
/// process.
class SignalBridge : public QObject {
    Q_OBJECT

public:
    explicit SignalBridge(QObject* parent = nullptr);
    ~SignalBridge() override;

    /// Route the given signals through the bridge.
    /// @return false if the pipe or a handler could not be set up.
    bool install(std::initializer_list<int> signos);

signals:
    void signalReceived(int signo);

private slots:
    void onReadable();

private:
    static void handle(int signo);

    static int s_fds[2];
    QSocketNotifier* notifier_ = nullptr;
};
