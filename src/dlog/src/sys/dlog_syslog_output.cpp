#include "sys/dlog_syslog_output.h"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "dlog_common.h"
#include "dlog_report.h"
#include "dlog_time.h"

namespace dlog {

DLOG_DECLARE_REPORT_LOGGER(DLogSyslogOutput)

static std::string getSslErrorStr() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown TLS error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

static DLogErrorCode setError(DLogErrorCode rc, const std::string& msg, std::string* errorMsg) {
    if (errorMsg != nullptr) {
        *errorMsg = msg;
    }
    return rc;
}

static void escapeSdValue(const std::string& value, std::string& res) {
    for (char c : value) {
        if (c == '\\' || c == '"' || c == ']') {
            res.push_back('\\');
        }
        res.push_back(c);
    }
}

static std::string fieldValueToStr(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

DLogSyslogOutput::DLogSyslogOutput(const DLogTargetConfig& config, int facility,
                                   uint32_t connectTimeoutMillis)
    : DLogOutput(config.m_name.c_str()),
      m_protocol(config.m_protocol),
      m_host(config.m_host),
      m_port(config.m_port),
      m_tag(config.m_tag),
      m_format(config.m_format),
      m_useTls(config.m_tlsEnabled || config.m_protocol == DLOG_SYSLOG_PROTOCOL_TLS),
      m_tlsCert(config.m_tlsCert),
      m_tlsKey(config.m_tlsKey),
      m_tlsCA(config.m_tlsCA),
      m_tlsSkipVerify(config.m_tlsSkipVerify),
      m_facility(facility),
      m_connectTimeoutMillis(connectTimeoutMillis),
      m_socket(-1),
      m_sslCtx(nullptr),
      m_ssl(nullptr),
      m_closed(false) {
    if (m_protocol.empty()) {
        m_protocol = DLOG_TARGET_DEFAULT_PROTOCOL;
    }
    if (m_format.empty()) {
        m_format = DLOG_TARGET_DEFAULT_FORMAT;
    }
}

DLogSyslogOutput::~DLogSyslogOutput() { (void)close(); }

DLogErrorCode DLogSyslogOutput::connect(std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    if (m_closed) {
        return setError(DLOG_E_CLOSED, "syslog connection is closed", errorMsg);
    }
    if (m_useTls && m_sslCtx == nullptr) {
        DLogErrorCode rc = initTls(errorMsg);
        if (rc != DLOG_E_OK) {
            // partially configured context is discarded, the next attempt starts over
            if (m_sslCtx != nullptr) {
                SSL_CTX_free(m_sslCtx);
                m_sslCtx = nullptr;
            }
            return rc;
        }
    }
    return dial(errorMsg);
}

DLogErrorCode DLogSyslogOutput::write(const DLogRecord& logRecord,
                                      std::string* errorMsg /* = nullptr */) {
    std::string msg =
        formatMessage(logRecord, m_format, m_facility, m_tag, getHostName(), getProcessId());

    std::unique_lock<std::mutex> lock(m_lock);
    if (m_closed || m_socket == -1) {
        return setError(DLOG_E_CLOSED, "syslog connection is closed", errorMsg);
    }

    std::string sendError;
    DLogErrorCode rc = sendMsg(msg, &sendError);
    if (rc == DLOG_E_OK) {
        return DLOG_E_OK;
    }

    // reconnect once and retry once
    DLOG_REPORT_WARN("Syslog write to %s:%d failed (%s), reconnecting", m_host.c_str(), m_port,
                     sendError.c_str());
    closeConnection();
    std::string dialError;
    rc = dial(&dialError);
    if (rc != DLOG_E_OK) {
        return setError(rc, "failed to reconnect to syslog: " + dialError, errorMsg);
    }
    rc = sendMsg(msg, &sendError);
    if (rc != DLOG_E_OK) {
        closeConnection();
        return setError(rc, "syslog write failed after reconnect: " + sendError, errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogSyslogOutput::close(std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_closed = true;
    closeConnection();
    if (m_sslCtx != nullptr) {
        SSL_CTX_free(m_sslCtx);
        m_sslCtx = nullptr;
    }
    return DLOG_E_OK;
}

bool DLogSyslogOutput::isConnected() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_socket != -1;
}

int DLogSyslogOutput::computePriority(int facility, DLogLevel logLevel) {
    return facility * 8 + dlogLevelToSyslogSeverity(logLevel);
}

std::string DLogSyslogOutput::formatMessage(const DLogRecord& logRecord, const std::string& format,
                                            int facility, const std::string& tag,
                                            const std::string& hostName, int pid) {
    int priority = computePriority(facility, logRecord.m_logLevel);
    std::string msg = "<" + std::to_string(priority) + ">";
    if (format == DLOG_SYSLOG_FORMAT_RFC5424) {
        // <PRI>1 TIMESTAMP HOSTNAME APP-NAME PROCID MSGID STRUCTURED-DATA MSG
        std::string msgId = "-";
        auto itr = logRecord.m_fields.find("action");
        if (itr != logRecord.m_fields.end() && !itr->is_null()) {
            std::string action = fieldValueToStr(*itr);
            if (!action.empty()) {
                msgId = action;
            }
        }
        msg += "1 ";
        msg += formatRfc3339Time(logRecord.m_logTime);
        msg += " ";
        msg += hostName.empty() ? "-" : hostName;
        msg += " ";
        msg += tag.empty() ? "-" : tag;
        msg += " ";
        msg += std::to_string(pid);
        msg += " ";
        msg += msgId;
        msg += " ";
        msg += formatStructuredData(logRecord, tag);
        msg += " ";
        msg += dlogRecordToJsonBody(logRecord);
    } else {
        // <PRI>Mmm dd hh:mm:ss TAG[PID]: MSG
        msg += formatRfc3164Time(logRecord.m_logTime);
        msg += " ";
        msg += tag;
        msg += "[" + std::to_string(pid) + "]: ";
        msg += dlogRecordToJsonBody(logRecord);
    }
    msg += "\n";
    return msg;
}

std::string DLogSyslogOutput::formatStructuredData(const DLogRecord& logRecord,
                                                   const std::string& tag) {
    if (logRecord.m_fields.empty()) {
        return "-";
    }
    std::string sd = "[" + tag + "@0";
    for (const auto& field : logRecord.m_fields.items()) {
        sd += " ";
        sd += field.key();
        sd += "=\"";
        escapeSdValue(fieldValueToStr(field.value()), sd);
        sd += "\"";
    }
    sd += "]";
    return sd;
}

DLogErrorCode DLogSyslogOutput::dial(std::string* errorMsg) {
    DLogErrorCode rc = connectSocket(errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    if (m_useTls) {
        rc = connectTls(errorMsg);
        if (rc != DLOG_E_OK) {
            closeConnection();
            return rc;
        }
    }
    DLOG_REPORT_DEBUG("Connected to syslog collector at %s:%d (%s%s)", m_host.c_str(), m_port,
                      m_protocol.c_str(), m_useTls ? ", TLS" : "");
    return DLOG_E_OK;
}

DLogErrorCode DLogSyslogOutput::connectSocket(std::string* errorMsg) {
    bool isUdp = (m_protocol == DLOG_SYSLOG_PROTOCOL_UDP) && !m_useTls;
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = isUdp ? SOCK_DGRAM : SOCK_STREAM;
    std::string portStr = std::to_string(m_port);
    struct addrinfo* addrList = nullptr;
    int res = getaddrinfo(m_host.c_str(), portStr.c_str(), &hints, &addrList);
    if (res != 0) {
        std::string reason = gai_strerror(res);
        DLOG_REPORT_ERROR("Failed to resolve syslog host %s: %s", m_host.c_str(), reason.c_str());
        return setError(DLOG_E_NET_ERROR, "failed to resolve " + m_host + ": " + reason,
                        errorMsg);
    }

    struct timeval timeout;
    timeout.tv_sec = m_connectTimeoutMillis / 1000;
    timeout.tv_usec = (m_connectTimeoutMillis % 1000) * 1000;

    int lastErr = 0;
    for (struct addrinfo* addr = addrList; addr != nullptr; addr = addr->ai_next) {
        int fd = socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if (fd < 0) {
            lastErr = errno;
            continue;
        }

        if (isUdp) {
            if (::connect(fd, addr->ai_addr, addr->ai_addrlen) != 0) {
                lastErr = errno;
                ::close(fd);
                continue;
            }
        } else {
            // non-blocking connect bounded by connect timeout
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            int rc = ::connect(fd, addr->ai_addr, addr->ai_addrlen);
            if (rc != 0 && errno != EINPROGRESS) {
                lastErr = errno;
                ::close(fd);
                continue;
            }
            if (rc != 0) {
                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                do {
                    rc = poll(&pfd, 1, (int)m_connectTimeoutMillis);
                } while (rc < 0 && errno == EINTR);
                if (rc == 0) {
                    lastErr = ETIMEDOUT;
                    ::close(fd);
                    continue;
                }
                if (rc < 0) {
                    lastErr = errno;
                    ::close(fd);
                    continue;
                }
                int sockErr = 0;
                socklen_t len = sizeof(sockErr);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &sockErr, &len) != 0 || sockErr != 0) {
                    lastErr = sockErr != 0 ? sockErr : errno;
                    ::close(fd);
                    continue;
                }
            }
            fcntl(fd, F_SETFL, flags);
        }

        // bound blocking writes (and TLS handshake reads)
        if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) != 0 ||
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
            DLOG_REPORT_SYS_ERROR(setsockopt, "Failed to set syslog socket timeouts");
        }
        m_socket = fd;
        break;
    }
    freeaddrinfo(addrList);

    if (m_socket == -1) {
        std::string reason = DLogReport::sysErrorToStr(lastErr);
        DLOG_REPORT_ERROR("Failed to connect to syslog collector at %s:%d: %s", m_host.c_str(),
                          m_port, reason.c_str());
        return setError(DLOG_E_NET_ERROR,
                        "failed to connect to " + m_host + ":" + portStr + ": " + reason,
                        errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogSyslogOutput::initTls(std::string* errorMsg) {
    m_sslCtx = SSL_CTX_new(TLS_client_method());
    if (m_sslCtx == nullptr) {
        return setError(DLOG_E_TLS_ERROR, "failed to create TLS context: " + getSslErrorStr(),
                        errorMsg);
    }
    SSL_CTX_set_min_proto_version(m_sslCtx, TLS1_2_VERSION);
    SSL_CTX_set_verify(m_sslCtx, m_tlsSkipVerify ? SSL_VERIFY_NONE : SSL_VERIFY_PEER, nullptr);

    // trust pool
    if (!m_tlsCA.empty()) {
        BIO* bio = BIO_new_mem_buf(m_tlsCA.data(), (int)m_tlsCA.size());
        if (bio == nullptr) {
            return setError(DLOG_E_NOMEM, "failed to allocate TLS buffer", errorMsg);
        }
        X509_STORE* store = SSL_CTX_get_cert_store(m_sslCtx);
        uint32_t certCount = 0;
        X509* cert = nullptr;
        while ((cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) != nullptr) {
            if (X509_STORE_add_cert(store, cert) == 1) {
                ++certCount;
            }
            X509_free(cert);
        }
        BIO_free(bio);
        // reading stops with a "no start line" error at end of input
        ERR_clear_error();
        if (certCount == 0) {
            DLOG_REPORT_ERROR("Failed to parse CA certificate of syslog target %s", getName());
            return setError(DLOG_E_TLS_ERROR, "failed to parse CA certificate", errorMsg);
        }
    } else if (!m_tlsSkipVerify) {
        SSL_CTX_set_default_verify_paths(m_sslCtx);
    }

    // client certificate
    if (!m_tlsCert.empty() && !m_tlsKey.empty()) {
        BIO* certBio = BIO_new_mem_buf(m_tlsCert.data(), (int)m_tlsCert.size());
        X509* cert = certBio ? PEM_read_bio_X509(certBio, nullptr, nullptr, nullptr) : nullptr;
        if (certBio != nullptr) {
            BIO_free(certBio);
        }
        if (cert == nullptr || SSL_CTX_use_certificate(m_sslCtx, cert) != 1) {
            std::string reason = getSslErrorStr();
            if (cert != nullptr) {
                X509_free(cert);
            }
            return setError(DLOG_E_TLS_ERROR, "failed to load TLS client certificate: " + reason,
                            errorMsg);
        }
        X509_free(cert);

        BIO* keyBio = BIO_new_mem_buf(m_tlsKey.data(), (int)m_tlsKey.size());
        EVP_PKEY* key =
            keyBio ? PEM_read_bio_PrivateKey(keyBio, nullptr, nullptr, nullptr) : nullptr;
        if (keyBio != nullptr) {
            BIO_free(keyBio);
        }
        if (key == nullptr || SSL_CTX_use_PrivateKey(m_sslCtx, key) != 1) {
            std::string reason = getSslErrorStr();
            if (key != nullptr) {
                EVP_PKEY_free(key);
            }
            return setError(DLOG_E_TLS_ERROR, "failed to load TLS client key: " + reason,
                            errorMsg);
        }
        EVP_PKEY_free(key);

        if (SSL_CTX_check_private_key(m_sslCtx) != 1) {
            return setError(DLOG_E_TLS_ERROR,
                            "TLS client key does not match certificate: " + getSslErrorStr(),
                            errorMsg);
        }
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogSyslogOutput::connectTls(std::string* errorMsg) {
    m_ssl = SSL_new(m_sslCtx);
    if (m_ssl == nullptr) {
        return setError(DLOG_E_TLS_ERROR, "failed to create TLS session: " + getSslErrorStr(),
                        errorMsg);
    }
    SSL_set_fd(m_ssl, m_socket);
    SSL_set_tlsext_host_name(m_ssl, m_host.c_str());
    if (!m_tlsSkipVerify) {
        SSL_set1_host(m_ssl, m_host.c_str());
    }

    SigPipeGuard sigPipeGuard;
    if (SSL_connect(m_ssl) != 1) {
        std::string reason = getSslErrorStr();
        DLOG_REPORT_ERROR("TLS handshake with syslog collector at %s:%d failed: %s", m_host.c_str(),
                          m_port, reason.c_str());
        return setError(DLOG_E_TLS_ERROR, "TLS handshake failed: " + reason, errorMsg);
    }
    return DLOG_E_OK;
}

void DLogSyslogOutput::closeConnection() {
    if (m_ssl != nullptr) {
        SigPipeGuard sigPipeGuard;
        SSL_shutdown(m_ssl);
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }
    if (m_socket != -1) {
        ::close(m_socket);
        m_socket = -1;
    }
}

DLogErrorCode DLogSyslogOutput::sendMsg(const std::string& msg, std::string* errorMsg) {
    if (m_socket == -1) {
        return setError(DLOG_E_CLOSED, "syslog connection is closed", errorMsg);
    }

    size_t offset = 0;
    if (m_ssl != nullptr) {
        SigPipeGuard sigPipeGuard;
        while (offset < msg.length()) {
            int res = SSL_write(m_ssl, msg.data() + offset, (int)(msg.length() - offset));
            if (res <= 0) {
                return setError(DLOG_E_NET_ERROR, "TLS write failed: " + getSslErrorStr(),
                                errorMsg);
            }
            offset += (size_t)res;
        }
        return DLOG_E_OK;
    }

    while (offset < msg.length()) {
        ssize_t res = send(m_socket, msg.data() + offset, msg.length() - offset, MSG_NOSIGNAL);
        if (res < 0) {
            if (errno == EINTR) {
                continue;
            }
            return setError(DLOG_E_NET_ERROR,
                            std::string("send failed: ") + DLogReport::sysErrorToStr(errno),
                            errorMsg);
        }
        offset += (size_t)res;
    }
    return DLOG_E_OK;
}

}  // namespace dlog
