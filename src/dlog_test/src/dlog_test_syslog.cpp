#include <unistd.h>

#include <cstring>

#include <nlohmann/json.hpp>

#include "dlog_test_common.h"
#include "sys/dlog_syslog_output.h"

TEST(DLogSyslog, Priority) {
    // daemon facility
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_WARN), 28);
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_INFO), 30);
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_DEBUG), 31);
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_NOTICE), 29);
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_ERROR), 27);
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_FATAL), 26);
    EXPECT_EQ(dlog::DLogSyslogOutput::computePriority(3, dlog::DLEVEL_PANIC), 26);
}

TEST(DLogSyslog, Rfc3164Format) {
    dlog::DLogRecord logRecord(dlog::DLEVEL_WARN, "disk almost full", {{"bucket", "photos"}});
    std::string msg = dlog::DLogSyslogOutput::formatMessage(logRecord, DLOG_SYSLOG_FORMAT_RFC3164,
                                                            3, "t", "host1", 4242);
    EXPECT_EQ(msg.compare(0, 4, "<28>"), 0);
    EXPECT_EQ(msg.back(), '\n');
    std::string::size_type tagPos = msg.find(" t[4242]: ");
    ASSERT_NE(tagPos, std::string::npos);

    // body is the record as JSON, the time stamp is carried by the header
    std::string body = msg.substr(tagPos + strlen(" t[4242]: "));
    body.pop_back();
    nlohmann::json jsonBody = nlohmann::json::parse(body);
    EXPECT_EQ(jsonBody["level"].get<std::string>(), "warn");
    EXPECT_EQ(jsonBody["message"].get<std::string>(), "disk almost full");
    EXPECT_EQ(jsonBody["fields"]["bucket"].get<std::string>(), "photos");
    EXPECT_FALSE(jsonBody.contains("timestamp"));
}

TEST(DLogSyslog, SameBodyForBothFormats) {
    dlog::DLogRecord logRecord(dlog::DLEVEL_ERROR, "quota exceeded",
                               {{"bucket", "photos"}, {"action", "put"}});
    std::string body = dlog::dlogRecordToJsonBody(logRecord) + "\n";
    std::string rfc3164Msg = dlog::DLogSyslogOutput::formatMessage(
        logRecord, DLOG_SYSLOG_FORMAT_RFC3164, 3, "t", "host1", 4242);
    std::string rfc5424Msg = dlog::DLogSyslogOutput::formatMessage(
        logRecord, DLOG_SYSLOG_FORMAT_RFC5424, 3, "t", "host1", 4242);
    ASSERT_GT(rfc3164Msg.size(), body.size());
    ASSERT_GT(rfc5424Msg.size(), body.size());
    EXPECT_EQ(rfc3164Msg.compare(rfc3164Msg.size() - body.size(), body.size(), body), 0);
    EXPECT_EQ(rfc5424Msg.compare(rfc5424Msg.size() - body.size(), body.size(), body), 0);
}

TEST(DLogSyslog, Rfc5424Format) {
    dlog::DLogRecord logRecord(dlog::DLEVEL_WARN, "object removed",
                               {{"k", "v"}, {"action", "delete"}});
    std::string msg = dlog::DLogSyslogOutput::formatMessage(logRecord, DLOG_SYSLOG_FORMAT_RFC5424,
                                                            3, "t", "host1", 4242);
    EXPECT_EQ(msg.compare(0, 6, "<28>1 "), 0);
    EXPECT_NE(msg.find(" host1 t 4242 delete [t@0 "), std::string::npos);
    EXPECT_NE(msg.find("k=\"v\""), std::string::npos);
    EXPECT_NE(msg.find("action=\"delete\""), std::string::npos);
    EXPECT_EQ(msg.back(), '\n');

    // no fields, no action
    dlog::DLogRecord plainRecord(dlog::DLEVEL_INFO, "plain");
    msg = dlog::DLogSyslogOutput::formatMessage(plainRecord, DLOG_SYSLOG_FORMAT_RFC5424, 3, "", "",
                                                1);
    EXPECT_EQ(msg.compare(0, 6, "<30>1 "), 0);
    EXPECT_NE(msg.find(" - - 1 - - {"), std::string::npos);
}

TEST(DLogSyslog, StructuredData) {
    dlog::DLogRecord logRecord(dlog::DLEVEL_INFO, "m", {{"k", "v"}});
    EXPECT_EQ(dlog::DLogSyslogOutput::formatStructuredData(logRecord, "t"), "[t@0 k=\"v\"]");

    dlog::DLogRecord escapedRecord(dlog::DLEVEL_INFO, "m", {{"p", "a\"b]c\\d"}});
    EXPECT_EQ(dlog::DLogSyslogOutput::formatStructuredData(escapedRecord, "t"),
              "[t@0 p=\"a\\\"b\\]c\\\\d\"]");

    dlog::DLogRecord numberRecord(dlog::DLEVEL_INFO, "m", {{"n", 7}});
    EXPECT_EQ(dlog::DLogSyslogOutput::formatStructuredData(numberRecord, "t"), "[t@0 n=\"7\"]");

    dlog::DLogRecord emptyRecord(dlog::DLEVEL_INFO, "m");
    EXPECT_EQ(dlog::DLogSyslogOutput::formatStructuredData(emptyRecord, "t"), "-");
}

static int testSyslogDelivery(bool useUdp) {
    TestSyslogServer server(useUdp);
    if (!server.start()) {
        return 1;
    }
    dlog::DLogTargetConfig config =
        makeSyslogConfig("collector", "127.0.0.1", server.getPort(), useUdp ? "udp" : "tcp");
    dlog::DLogSyslogOutput output(config, 3, 2000);
    std::string errorMsg;
    if (output.connect(&errorMsg) != dlog::DLOG_E_OK) {
        fprintf(stderr, "Failed to connect to test syslog server: %s\n", errorMsg.c_str());
        return 2;
    }
    for (int i = 0; i < 3; ++i) {
        dlog::DLogRecord logRecord(dlog::DLEVEL_ERROR, "record " + std::to_string(i));
        if (output.write(logRecord, &errorMsg) != dlog::DLOG_E_OK) {
            fprintf(stderr, "Syslog write failed: %s\n", errorMsg.c_str());
            return 3;
        }
    }
    if (!server.waitForLines(3)) {
        return 4;
    }
    std::vector<std::string> lines = server.getLines();
    std::string tagPrefix = " dlogtest[" + std::to_string(getpid()) + "]: ";
    for (int i = 0; i < 3; ++i) {
        if (lines[i].compare(0, 4, "<27>") != 0) {
            return 5;
        }
        if (lines[i].find(tagPrefix) == std::string::npos) {
            return 6;
        }
        // per-connection FIFO
        if (lines[i].find("record " + std::to_string(i)) == std::string::npos) {
            return 7;
        }
    }
    (void)output.close();
    return 0;
}

TEST(DLogSyslog, TcpDelivery) {
    int res = testSyslogDelivery(false);
    EXPECT_EQ(res, 0);
}

TEST(DLogSyslog, UdpDelivery) {
    int res = testSyslogDelivery(true);
    EXPECT_EQ(res, 0);
}

static int testReconnect() {
    TestSyslogServer server;
    if (!server.start()) {
        return 1;
    }
    dlog::DLogTargetConfig config = makeSyslogConfig("collector", "127.0.0.1", server.getPort());
    dlog::DLogSyslogOutput output(config, 3, 2000);
    if (output.connect() != dlog::DLOG_E_OK) {
        return 2;
    }
    if (output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "before drop")) != dlog::DLOG_E_OK) {
        return 3;
    }
    if (!server.waitForLines(1)) {
        return 4;
    }

    // the first write after the peer has gone may still be accepted by the local stack, so keep
    // writing until the broken connection is detected and replaced
    server.dropConnections();
    bool reconnected = false;
    for (int i = 0; i < 50 && !reconnected; ++i) {
        std::string errorMsg;
        dlog::DLogErrorCode rc =
            output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "after drop"), &errorMsg);
        if (rc != dlog::DLOG_E_OK) {
            fprintf(stderr, "Write after drop failed: %s\n", errorMsg.c_str());
            return 5;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        reconnected = server.getConnectionCount() >= 2;
    }
    if (!reconnected) {
        return 6;
    }
    bool delivered = waitFor([&server]() {
        for (const std::string& line : server.getLines()) {
            if (line.find("after drop") != std::string::npos) {
                return true;
            }
        }
        return false;
    });
    if (!delivered) {
        return 7;
    }
    (void)output.close();
    return 0;
}

TEST(DLogSyslog, Reconnect) {
    int res = testReconnect();
    EXPECT_EQ(res, 0);
}

TEST(DLogSyslog, WriteAfterClose) {
    TestSyslogServer server;
    ASSERT_TRUE(server.start());
    dlog::DLogTargetConfig config = makeSyslogConfig("collector", "127.0.0.1", server.getPort());
    dlog::DLogSyslogOutput output(config, 3, 2000);
    ASSERT_EQ(output.connect(), dlog::DLOG_E_OK);
    EXPECT_TRUE(output.isConnected());
    EXPECT_EQ(output.close(), dlog::DLOG_E_OK);
    EXPECT_FALSE(output.isConnected());

    std::string errorMsg;
    EXPECT_EQ(output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "late"), &errorMsg),
              dlog::DLOG_E_CLOSED);
    EXPECT_EQ(errorMsg, "syslog connection is closed");
    // no reconnect after close
    EXPECT_TRUE(waitFor([&server]() { return server.getConnectionCount() >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(server.getConnectionCount(), 1u);

    // double close is harmless
    EXPECT_EQ(output.close(), dlog::DLOG_E_OK);
}

TEST(DLogSyslog, ConnectRefused) {
    int port = 0;
    {
        TestSyslogServer server;
        ASSERT_TRUE(server.start());
        port = server.getPort();
    }
    dlog::DLogTargetConfig config = makeSyslogConfig("collector", "127.0.0.1", port);
    dlog::DLogSyslogOutput output(config, 3, 2000);
    std::string errorMsg;
    EXPECT_EQ(output.connect(&errorMsg), dlog::DLOG_E_NET_ERROR);
    EXPECT_FALSE(errorMsg.empty());
}

TEST(DLogSyslog, InvalidCACertificate) {
    dlog::DLogTargetConfig config = makeSyslogConfig("collector", "127.0.0.1", 6514, "tcp+tls");
    config.m_tlsCA = "-----BEGIN CERTIFICATE-----\nnot a certificate\n-----END CERTIFICATE-----\n";
    dlog::DLogSyslogOutput output(config, 3, 2000);
    std::string errorMsg;
    EXPECT_EQ(output.connect(&errorMsg), dlog::DLOG_E_TLS_ERROR);
    EXPECT_EQ(errorMsg, "failed to parse CA certificate");
}
