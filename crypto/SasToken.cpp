/**
 * @file SasToken.cpp
 * @brief Connection string parsing and IoT hub SAS token generation
 *
 * Uses OpenSSL for HMAC-SHA256 and Base64. The signature covers the
 * URL-encoded resource URI and the expiry, separated by a newline.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Designed for embedded portability - can be adapted to use mbedTLS
 */

#include "SasToken.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace hublink {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string trimmed(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

ConnectionString ConnectionString::parse(const std::string& text) {
    ConnectionString result;
    std::istringstream ss(text);
    std::string part;

    while (std::getline(ss, part, ';')) {
        part = trimmed(part);
        if (part.empty()) {
            continue;
        }
        // Keys never contain '=', values (base64 keys) may end with it.
        const auto equalPos = part.find('=');
        if (equalPos == std::string::npos || equalPos == 0) {
            throw std::runtime_error("Malformed connection string segment: '" + part + "'");
        }
        const std::string key = part.substr(0, equalPos);
        const std::string value = part.substr(equalPos + 1);

        if (key == "HostName") {
            result.hostName = value;
        } else if (key == "DeviceId") {
            result.deviceId = value;
        } else if (key == "SharedAccessKey") {
            result.sharedAccessKey = value;
        } else if (key == "ModuleId") {
            result.moduleId = value;
        } else if (key == "GatewayHostName") {
            result.gatewayHostName = value;
        }
    }

    if (result.hostName.empty()) {
        throw std::runtime_error("Connection string is missing HostName");
    }
    if (result.deviceId.empty()) {
        throw std::runtime_error("Connection string is missing DeviceId");
    }
    if (result.sharedAccessKey.empty()) {
        throw std::runtime_error("Connection string is missing SharedAccessKey");
    }
    if (SasToken::base64Decode(result.sharedAccessKey).empty()) {
        throw std::runtime_error("SharedAccessKey is not valid base64");
    }
    return result;
}

std::string ConnectionString::resourceUri() const {
    // Resource URI must use the lowercase hostname.
    std::string host = hostName;
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string uri = host + "/devices/" + deviceId;
    if (!moduleId.empty()) {
        uri += "/modules/" + moduleId;
    }
    return uri;
}

std::string ConnectionString::endpointHost() const {
    return gatewayHostName.empty() ? hostName : gatewayHostName;
}

std::string ConnectionString::clientId() const {
    return moduleId.empty() ? deviceId : deviceId + "/" + moduleId;
}

std::string SasToken::generate(const ConnectionString& connection, const IClock& clock, std::uint64_t ttlSeconds) {
    return generate(connection.resourceUri(), connection.sharedAccessKey, clock.epochSeconds() + ttlSeconds);
}

std::string SasToken::generate(const std::string& resourceUri,
                               const std::string& keyBase64,
                               std::uint64_t expiryEpochSeconds) {
    const std::string stringToSign = urlEncode(resourceUri) + "\n" + std::to_string(expiryEpochSeconds);
    const std::string signature = base64Encode(hmacSha256(base64Decode(keyBase64), stringToSign));

    std::ostringstream token;
    token << "SharedAccessSignature sr=" << urlEncode(resourceUri)
          << "&sig=" << urlEncode(signature)
          << "&se=" << expiryEpochSeconds;
    return token.str();
}

std::string SasToken::hmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    const unsigned char* result = HMAC(EVP_sha256(),
                                       key.data(), static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                       digest, &digestLength);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digestLength);
}

std::string SasToken::base64Encode(const std::string& data) {
    BioPtr b64(BIO_new(BIO_f_base64()));
    BIO* mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem) {
        BIO_free(mem);
        throw std::runtime_error("Failed to allocate OpenSSL BIO");
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO_push(b64.get(), mem);

    BIO_write(b64.get(), data.data(), static_cast<int>(data.size()));
    BIO_flush(b64.get());

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(b64.get(), &buffer);
    return std::string(buffer->data, buffer->length);
}

std::string SasToken::base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    BioPtr b64(BIO_new(BIO_f_base64()));
    BIO* mem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    if (!b64 || !mem) {
        BIO_free(mem);
        throw std::runtime_error("Failed to allocate OpenSSL BIO");
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO_push(b64.get(), mem);

    std::string result(encoded.size(), '\0');
    const int decodedLength = BIO_read(b64.get(), &result[0], static_cast<int>(result.size()));
    if (decodedLength <= 0) {
        return {};
    }
    result.resize(static_cast<std::size_t>(decodedLength));
    return result;
}

std::string SasToken::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }
    return escaped.str();
}

std::string SasToken::urlDecode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const int high = hexValue(value[i + 1]);
            const int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        decoded += value[i];
    }
    return decoded;
}

} // namespace hublink
