#include "http_server.h"
#include "logger.h"
#include "thread_pool.h"

#include <QHostAddress>
#include <QMetaObject>
#include <QPointer>
#include <QStringList>

HttpServer::HttpServer(RangeService* service, ThreadPool* workers, QObject* parent)
    : QObject(parent)
    , server_(new QTcpServer(this))
    , service_(service)
    , workers_(workers)
{
    connect(server_, &QTcpServer::newConnection,
            this, &HttpServer::onNewConnection);
}

HttpServer::~HttpServer()
{
    stop();
}

bool HttpServer::start(const QString& address, quint16 port)
{
    if (server_->isListening()) return true;

    QHostAddress host;
    if (!host.setAddress(address)) {
        Logger::instance().error("invalid listen address " + address.toStdString());
        return false;
    }
    if (!server_->listen(host, port)) {
        Logger::instance().error("listen on " + address.toStdString() + ":"
            + std::to_string(port) + " failed: " + server_->errorString().toStdString());
        return false;
    }
    Logger::instance().info("listening on " + address.toStdString() + ":"
        + std::to_string(server_->serverPort()));
    return true;
}

void HttpServer::stop()
{
    for (auto* c : clients_) {
        c->close();
        c->deleteLater();
    }
    clients_.clear();
    buffers_.clear();
    dispatched_.clear();
    server_->close();
}

bool HttpServer::isListening() const
{
    return server_->isListening();
}

quint16 HttpServer::serverPort() const
{
    return server_->serverPort();
}

void HttpServer::onNewConnection()
{
    while (server_->hasPendingConnections()) {
        auto* socket = server_->nextPendingConnection();
        if (!socket) continue;
        clients_.append(socket);
        connect(socket, &QTcpSocket::readyRead, this, &HttpServer::onReadyRead);
        connect(socket, &QTcpSocket::disconnected, this, &HttpServer::onDisconnected);
    }
}

void HttpServer::onReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) return;

    if (dispatched_.contains(socket)) {
        // Request already taken; anything more is an unread body.
        socket->readAll();
        return;
    }

    QByteArray& buf = buffers_[socket];
    buf.append(socket->readAll());

    int end = buf.indexOf("\r\n\r\n");
    if (end < 0) {
        if (buf.size() > kMaxHeadBytes) {
            writeResponse(socket, errorResponse(400, "Request header too large"), true);
        }
        return;
    }

    ProxyRequest request;
    QString error;
    if (!parseRequestHead(buf.left(end), request, error)) {
        Logger::instance().warn("bad request: " + error.toStdString());
        writeResponse(socket, errorResponse(400, error.toStdString()), true);
        return;
    }
    buf.clear();
    dispatch(socket, std::move(request));
}

void HttpServer::onDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) return;
    clients_.removeAll(socket);
    buffers_.remove(socket);
    dispatched_.remove(socket);
    socket->deleteLater();
}

void HttpServer::dispatch(QTcpSocket* socket, ProxyRequest request)
{
    dispatched_.insert(socket);
    if (workers_->pending() >= workers_->size()) {
        Logger::instance().warn("request backlog: " + std::to_string(workers_->pending())
            + " queued, " + std::to_string(workers_->busy()) + " running");
    }
    const bool include_body = request.method != "HEAD";

    QPointer<QTcpSocket> target(socket);
    QPointer<HttpServer> self(this);
    RangeService* service = service_;

    try {
        workers_->submit([service, request = std::move(request), target, self, include_body] {
            ProxyResponse response = service->handle(request);
            if (!self) return;
            QMetaObject::invokeMethod(self.data(),
                [self, target, response = std::move(response), include_body] {
                    if (self && target) {
                        self->writeResponse(target.data(), response, include_body);
                    }
                },
                Qt::QueuedConnection);
        });
    } catch (const std::runtime_error& e) {
        Logger::instance().error(std::string("cannot dispatch request: ") + e.what());
        writeResponse(socket, errorResponse(503, "Service shutting down"), true);
    }
}

void HttpServer::writeResponse(QTcpSocket* socket, const ProxyResponse& response, bool include_body)
{
    socket->write(serializeResponse(response, include_body));
    socket->disconnectFromHost();
}

// ── Wire format ────────────────────────────────────────────────

bool HttpServer::parseRequestHead(const QByteArray& head, ProxyRequest& out, QString& error)
{
    const QList<QByteArray> lines = head.split('\n');
    if (lines.isEmpty()) {
        error = "empty request";
        return false;
    }

    const QList<QByteArray> parts = lines.first().trimmed().split(' ');
    if (parts.size() != 3 || !parts[2].startsWith("HTTP/1.")) {
        error = "malformed request line";
        return false;
    }

    out.method = parts[0].toStdString();
    QByteArray target = parts[1];
    // Absolute-form target: keep only path and query.
    if (target.startsWith("http://") || target.startsWith("https://")) {
        int scheme_end = target.indexOf("://") + 3;
        int path_start = target.indexOf('/', scheme_end);
        target = path_start < 0 ? QByteArray("/") : target.mid(path_start);
    }
    if (!target.startsWith('/')) {
        error = "unsupported request target";
        return false;
    }
    out.target = target.toStdString();

    out.headers.clear();
    out.has_body = false;
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty()) continue;
        int colon = line.indexOf(':');
        if (colon <= 0) {
            error = "malformed header field";
            return false;
        }
        const QByteArray name = line.left(colon).trimmed();
        const QByteArray value = line.mid(colon + 1).trimmed();
        out.headers.emplace_back(name.toStdString(), value.toStdString());

        if (name.compare("Content-Length", Qt::CaseInsensitive) == 0) {
            bool ok = false;
            qlonglong len = value.toLongLong(&ok);
            if (!ok || len < 0) {
                error = "invalid Content-Length";
                return false;
            }
            if (len > 0) out.has_body = true;
        } else if (name.compare("Transfer-Encoding", Qt::CaseInsensitive) == 0) {
            out.has_body = true;
        }
    }
    return true;
}

QByteArray HttpServer::serializeResponse(const ProxyResponse& response, bool include_body)
{
    QByteArray out;
    out.append("HTTP/1.1 ");
    out.append(QByteArray::number(response.status));
    out.append(' ');
    out.append(reasonPhrase(response.status));
    out.append("\r\n");
    for (const auto& [name, value] : response.headers) {
        out.append(name.data(), static_cast<qsizetype>(name.size()));
        out.append(": ");
        out.append(value.data(), static_cast<qsizetype>(value.size()));
        out.append("\r\n");
    }
    out.append("Connection: close\r\n\r\n");
    if (include_body) {
        out.append(response.body.data(), static_cast<qsizetype>(response.body.size()));
    }
    return out;
}
