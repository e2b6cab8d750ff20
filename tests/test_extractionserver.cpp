/**
 * @file test_extractionserver.cpp
 * @brief Routing tests for the HTTP front end
 *
 * Most requests go through ExtractionServer::route() so no socket is opened.
 * ExtractionServerSocketTest covers the request loop over a loopback
 * connection.
 */

#include <gtest/gtest.h>
#include "network/extractionserver.h"
#include "service/extractionservice.h"
#include "history/metricsstore.h"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpSocket>

#include <memory>

class ExtractionServerTest : public ::testing::Test {
protected:
    QJsonObject bodyObject(const HttpResponse& response) const {
        return QJsonDocument::fromJson(response.body).object();
    }
    QJsonArray bodyArray(const HttpResponse& response) const {
        return QJsonDocument::fromJson(response.body).array();
    }

    MetricsStore store;
    ExtractionService service{&store, ParameterValidator(), ExtractionSimulator()};
    ExtractionServer server{&service};
};

TEST_F(ExtractionServerTest, EmptyMetricsIsEmptyArray) {
    HttpResponse response = server.route("GET", "/metrics");

    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.contentType, "application/json");
    EXPECT_EQ(response.body, "[]");
}

TEST_F(ExtractionServerTest, StartWithoutParametersUsesDefaults) {
    HttpResponse response = server.route("POST", "/start");
    ASSERT_EQ(response.statusCode, 200);

    QJsonObject record = bodyObject(response);
    EXPECT_EQ(record["id"].toInteger(), 1);
    EXPECT_DOUBLE_EQ(record["parameters"].toObject()["temperature"].toDouble(), 93.0);
    EXPECT_EQ(record["outcome"].toObject()["classification"].toString(), "Perfect Extraction");
}

TEST_F(ExtractionServerTest, StartThenMetricsShowsRecord) {
    HttpResponse start = server.route("POST", "/start?temperature=95&pressure=9.5&time_seconds=27");
    ASSERT_EQ(start.statusCode, 200);

    QJsonObject outcome = bodyObject(start)["outcome"].toObject();
    EXPECT_EQ(outcome["classification"].toString(), "Perfect Extraction");
    EXPECT_NEAR(outcome["qualityScore"].toDouble(), 86.04, 0.01);

    HttpResponse metrics = server.route("GET", "/metrics");
    ASSERT_EQ(metrics.statusCode, 200);
    QJsonArray records = bodyArray(metrics);
    ASSERT_EQ(records.size(), 1);

    QJsonObject parameters = records.last().toObject()["parameters"].toObject();
    EXPECT_DOUBLE_EQ(parameters["temperature"].toDouble(), 95.0);
    EXPECT_DOUBLE_EQ(parameters["pressure"].toDouble(), 9.5);
    EXPECT_DOUBLE_EQ(parameters["time_seconds"].toDouble(), 27.0);
}

TEST_F(ExtractionServerTest, OutOfRangeIsBadRequest) {
    HttpResponse response = server.route("POST", "/start?temperature=200");

    EXPECT_EQ(response.statusCode, 400);
    QJsonObject error = bodyObject(response);
    EXPECT_EQ(error["error"].toString(), "OutOfRange");
    EXPECT_EQ(error["field"].toString(), "temperature");
    EXPECT_DOUBLE_EQ(error["min"].toDouble(), 85.0);
    EXPECT_DOUBLE_EQ(error["max"].toDouble(), 100.0);
    EXPECT_TRUE(store.isEmpty());
}

TEST_F(ExtractionServerTest, MalformedAndEmptyValuesAreBadRequest) {
    HttpResponse text = server.route("POST", "/start?pressure=high");
    EXPECT_EQ(text.statusCode, 400);
    EXPECT_EQ(bodyObject(text)["error"].toString(), "Malformed");

    HttpResponse empty = server.route("POST", "/start?time_seconds=");
    EXPECT_EQ(empty.statusCode, 400);
    EXPECT_EQ(bodyObject(empty)["field"].toString(), "time_seconds");

    EXPECT_TRUE(store.isEmpty());
}

TEST_F(ExtractionServerTest, WrongMethodIsRejected) {
    EXPECT_EQ(server.route("GET", "/start").statusCode, 405);
    EXPECT_EQ(server.route("POST", "/metrics").statusCode, 405);
    EXPECT_EQ(server.route("DELETE", "/api/alerts").statusCode, 405);
    EXPECT_TRUE(store.isEmpty());
}

TEST_F(ExtractionServerTest, UnknownPathIsNotFound) {
    HttpResponse response = server.route("GET", "/espresso");
    EXPECT_EQ(response.statusCode, 404);
    EXPECT_EQ(bodyObject(response)["error"].toString(), "Not Found");
}

TEST_F(ExtractionServerTest, ApiAliasesAndTrailingSlash) {
    EXPECT_EQ(server.route("POST", "/api/extraction?pressure=8").statusCode, 200);
    EXPECT_EQ(server.route("GET", "/api/metrics/").statusCode, 200);
    EXPECT_EQ(bodyArray(server.route("GET", "/metrics/")).size(), 1);
}

TEST_F(ExtractionServerTest, TrendsByPeriod) {
    server.route("POST", "/start");
    server.route("POST", "/start?temperature=100&pressure=12&time_seconds=40");

    HttpResponse response = server.route("GET", "/api/trends?period=weekly");
    ASSERT_EQ(response.statusCode, 200);
    QJsonObject trends = bodyObject(response);
    EXPECT_EQ(trends["period"].toString(), "weekly");
    EXPECT_EQ(trends["sampleCount"].toInt(), 2);
    EXPECT_DOUBLE_EQ(trends["perfectExtractionRate"].toDouble(), 50.0);

    EXPECT_EQ(bodyObject(server.route("GET", "/api/trends"))["period"].toString(), "all");
}

TEST_F(ExtractionServerTest, UnknownTrendPeriodIsBadRequest) {
    HttpResponse response = server.route("GET", "/api/trends?period=bogus");
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_TRUE(bodyObject(response)["error"].toString().contains("bogus"));
}

TEST_F(ExtractionServerTest, AlertsListDeviations) {
    EXPECT_EQ(bodyArray(server.route("GET", "/api/alerts")).size(), 0);

    server.route("POST", "/start?temperature=99");
    QJsonArray alerts = bodyArray(server.route("GET", "/api/alerts"));

    QStringList rules;
    for (const QJsonValue& value : alerts) {
        rules << value.toObject()["rule"].toString();
    }
    EXPECT_TRUE(rules.contains("Temperature Deviation"));
}

TEST_F(ExtractionServerTest, IndexDescribesService) {
    HttpResponse response = server.route("GET", "/");
    ASSERT_EQ(response.statusCode, 200);
    QJsonObject index = bodyObject(response);
    EXPECT_EQ(index["name"].toString(), "Mastrena");
    EXPECT_EQ(index["records"].toInt(), 0);
}

TEST_F(ExtractionServerTest, NotRunningUntilStarted) {
    EXPECT_FALSE(server.isRunning());
    EXPECT_TRUE(server.url().isEmpty());
}

TEST_F(ExtractionServerTest, PortOutsideTcpRangeIsRefused) {
    server.setPort(70000);
    EXPECT_FALSE(server.start());
    EXPECT_FALSE(server.isRunning());

    server.setPort(-1);
    EXPECT_FALSE(server.start());
}

TEST_F(ExtractionServerTest, InvalidBindAddressIsRefused) {
    server.setBindAddress("not-an-address");
    EXPECT_FALSE(server.start());
}

class ExtractionServerSocketTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!QCoreApplication::instance()) {
            s_app = std::make_unique<QCoreApplication>(s_argc, s_argv);
        }
    }
    static void TearDownTestSuite() {
        s_app.reset();
    }

    void SetUp() override {
        server.setPort(0);
        ASSERT_TRUE(server.start());
        ASSERT_GT(server.port(), 0);
    }

    // Sends the chunks one after another, letting the server read each one,
    // and returns everything received until the server closes the connection
    QByteArray exchange(const QList<QByteArray>& chunks) {
        QTcpSocket client;
        QByteArray received;
        QObject::connect(&client, &QTcpSocket::readyRead, [&client, &received]() {
            received.append(client.readAll());
        });

        client.connectToHost(QHostAddress::LocalHost, static_cast<quint16>(server.port()));
        if (!spinUntil([&client]() { return client.state() == QAbstractSocket::ConnectedState; })) {
            return QByteArray();
        }

        for (const QByteArray& chunk : chunks) {
            client.write(chunk);
            client.flush();
            spinFor(50);
        }

        spinUntil([&client]() { return client.state() == QAbstractSocket::UnconnectedState; });
        received.append(client.readAll());
        return received;
    }

    template <typename Predicate>
    static bool spinUntil(Predicate done, int timeoutMs = 5000) {
        QElapsedTimer timer;
        timer.start();
        while (!done()) {
            if (timer.elapsed() > timeoutMs) return false;
            QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        }
        return true;
    }

    static void spinFor(int ms) {
        QElapsedTimer timer;
        timer.start();
        while (timer.elapsed() < ms) {
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        }
    }

    static QByteArray statusLine(const QByteArray& response) {
        return response.left(response.indexOf("\r\n"));
    }
    static QByteArray body(const QByteArray& response) {
        int end = static_cast<int>(response.indexOf("\r\n\r\n"));
        return end < 0 ? QByteArray() : response.mid(end + 4);
    }

    static int s_argc;
    static char* s_argv[];
    static std::unique_ptr<QCoreApplication> s_app;

    MetricsStore store;
    ExtractionService service{&store, ParameterValidator(), ExtractionSimulator()};
    ExtractionServer server{&service};
};

int ExtractionServerSocketTest::s_argc = 1;
char* ExtractionServerSocketTest::s_argv[] = {const_cast<char*>("mastrena_tests"), nullptr};
std::unique_ptr<QCoreApplication> ExtractionServerSocketTest::s_app;

TEST_F(ExtractionServerSocketTest, HeadersSplitAcrossReads) {
    QByteArray response = exchange({
        "POST /start?temperature=95&pressure=9.5&time_seconds=27 HTTP/1.1\r\nHost: loc",
        "alhost\r\n\r\n"
    });

    EXPECT_EQ(statusLine(response), "HTTP/1.1 200 OK");
    EXPECT_TRUE(response.contains("Content-Type: application/json\r\n"));
    EXPECT_TRUE(response.contains("Access-Control-Allow-Origin: *\r\n"));
    EXPECT_TRUE(response.contains("Connection: close\r\n"));

    QJsonObject record = QJsonDocument::fromJson(body(response)).object();
    EXPECT_EQ(record["id"].toInteger(), 1);
    EXPECT_EQ(store.size(), 1);
}

TEST_F(ExtractionServerSocketTest, BodySplitAcrossReads) {
    QByteArray response = exchange({
        "POST /start HTTP/1.1\r\nContent-Length: 10\r\n\r\n01234",
        "56789"
    });

    EXPECT_EQ(statusLine(response), "HTTP/1.1 200 OK");
    EXPECT_EQ(store.size(), 1);
}

TEST_F(ExtractionServerSocketTest, ContentLengthMatchesBody) {
    QByteArray response = exchange({"GET /metrics HTTP/1.1\r\n\r\n"});

    EXPECT_EQ(statusLine(response), "HTTP/1.1 200 OK");
    EXPECT_TRUE(response.contains("Content-Length: 2\r\n"));
    EXPECT_EQ(body(response), "[]");
}

TEST_F(ExtractionServerSocketTest, OversizedHeaderWithTerminatorIsRejected) {
    QByteArray request = "POST /start HTTP/1.1\r\nX-Pad: ";
    request.append(QByteArray(100 * 1024, 'a'));
    request.append("\r\n\r\n");

    QByteArray response = exchange({request});

    EXPECT_EQ(statusLine(response), "HTTP/1.1 413 Payload Too Large");
    EXPECT_TRUE(store.isEmpty());
}

TEST_F(ExtractionServerSocketTest, OversizedBodyIsRejected) {
    QByteArray response = exchange({"POST /start HTTP/1.1\r\nContent-Length: 2000000\r\n\r\n"});

    EXPECT_EQ(statusLine(response), "HTTP/1.1 413 Payload Too Large");
    EXPECT_TRUE(store.isEmpty());
}

TEST_F(ExtractionServerSocketTest, MalformedRequestLineIsBadRequest) {
    QByteArray response = exchange({"GARBAGE\r\n\r\n"});

    EXPECT_EQ(statusLine(response), "HTTP/1.1 400 Bad Request");
    EXPECT_EQ(QJsonDocument::fromJson(body(response)).object()["error"].toString(),
              "Malformed request line");
}

TEST_F(ExtractionServerSocketTest, WrongMethodOverSocket) {
    QByteArray response = exchange({"GET /start HTTP/1.1\r\n\r\n"});

    EXPECT_EQ(statusLine(response), "HTTP/1.1 405 Method Not Allowed");
}
