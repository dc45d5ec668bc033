#pragma once

#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QSet>
#include <QString>

#include "range_service.h"

class ThreadPool;

/// Minimal HTTP/1.1 front end on QTcpServer.
/// One request per connection; the pipeline runs on a worker pool and the
/// response is written back on the socket's thread.
class HttpServer : public QObject {
    Q_OBJECT

public:
    HttpServer(RangeService* service, ThreadPool* workers, QObject* parent = nullptr);
    ~HttpServer() override;

    bool start(const QString& address, quint16 port);
    void stop();
    bool isListening() const;
    quint16 serverPort() const;

    /// Parse a request head (request line + header fields, without the blank
    /// line). Returns false and sets error on malformed input.
    static bool parseRequestHead(const QByteArray& head, ProxyRequest& out, QString& error);

    /// Serialize a response; the body is omitted for HEAD requests.
    static QByteArray serializeResponse(const ProxyResponse& response, bool include_body);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    void dispatch(QTcpSocket* socket, ProxyRequest request);
    void writeResponse(QTcpSocket* socket, const ProxyResponse& response, bool include_body);

    QTcpServer* server_;
    RangeService* service_;   // non-owning
    ThreadPool* workers_;     // non-owning
    QList<QTcpSocket*> clients_;
    QMap<QTcpSocket*, QByteArray> buffers_;
    // Sockets whose request has been handed to a worker
    QSet<QTcpSocket*> dispatched_;

    static constexpr int kMaxHeadBytes = 16 * 1024;
};
