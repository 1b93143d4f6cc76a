#include "mailjmap/mail_utils.hpp"
#include "mailjmap/sync_exception.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdlib.h>
#include <string.h>

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include "picosha2.h"

std::string MailUtils::toBase64(const char * pbegin, size_t len) {
    if (len == 0) {
        return "";
    }
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), reinterpret_cast<const unsigned char *>(pbegin), (int)len);
    out.resize(written);
    return out;
}

std::string MailUtils::fromBase64(const std::string & encoded) {
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (!isspace((unsigned char)c)) {
            clean.push_back(c);
        }
    }
    if (clean.size() == 0) {
        return "";
    }
    if (clean.size() % 4 != 0) {
        throw SyncException("invalid-base64", "Length is not a multiple of 4", false);
    }

    std::string out(3 * clean.size() / 4, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]), reinterpret_cast<const unsigned char *>(clean.data()), (int)clean.size());
    if (written < 0) {
        throw SyncException("invalid-base64", "EVP_DecodeBlock failed", false);
    }
    // EVP_DecodeBlock counts the padding bytes as output
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    out.resize(written - padding);
    return out;
}

std::string MailUtils::sha256Hex(const std::string & bytes) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(bytes.begin(), bytes.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string MailUtils::toHex(const unsigned char * bytes, size_t len) {
    static const char * digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t ii = 0; ii < len; ii ++) {
        out.push_back(digits[bytes[ii] >> 4]);
        out.push_back(digits[bytes[ii] & 0x0F]);
    }
    return out;
}

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string MailUtils::timestampForTime(time_t time) {
    struct tm ptm;
    gmtime_r(&time, &ptm);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%dT%H:%M:%SZ", &ptm);
    return std::string(buffer);
}

time_t MailUtils::timeForTimestamp(std::string timestamp) {
    // 2024-03-01T10:20:30Z, 2024-03-01T10:20:30.123Z, 2024-03-01T10:20:30+02:00
    static const std::regex re("^(\\d{4})-(\\d{2})-(\\d{2})[T ](\\d{2}):(\\d{2}):(\\d{2})(\\.\\d+)?(Z|[+-]\\d{2}:?\\d{2})?$");
    std::smatch m;
    if (!std::regex_match(timestamp, m, re)) {
        return -1;
    }
    struct tm t;
    memset(&t, 0, sizeof(t));
    t.tm_year = std::stoi(m[1].str()) - 1900;
    t.tm_mon = std::stoi(m[2].str()) - 1;
    t.tm_mday = std::stoi(m[3].str());
    t.tm_hour = std::stoi(m[4].str());
    t.tm_min = std::stoi(m[5].str());
    t.tm_sec = std::stoi(m[6].str());
    time_t result = timegm(&t);

    std::string zone = m[8].str();
    if (zone.size() > 1) {
        int sign = zone[0] == '-' ? -1 : 1;
        std::string digits = zone.substr(1);
        digits.erase(std::remove(digits.begin(), digits.end(), ':'), digits.end());
        int offset = std::stoi(digits.substr(0, 2)) * 3600 + std::stoi(digits.substr(2, 2)) * 60;
        result -= sign * offset;
    }
    return result;
}

std::string MailUtils::idRandomlyGenerated() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw SyncException("random", "RAND_bytes failed to produce an identifier", true);
    }
    // RFC 4122 version 4 layout
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::string hex = toHex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string MailUtils::trim(std::string str) {
    size_t start = 0;
    while (start < str.size() && isspace((unsigned char)str[start])) {
        start++;
    }
    size_t end = str.size();
    while (end > start && isspace((unsigned char)str[end - 1])) {
        end--;
    }
    return str.substr(start, end - start);
}

std::string MailUtils::toLower(std::string str) {
    transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

std::string MailUtils::toUpper(std::string str) {
    transform(str.begin(), str.end(), str.begin(), ::toupper);
    return str;
}

std::string MailUtils::normalizeEmail(std::string email) {
    return toLower(trim(email));
}

std::string MailUtils::urlEncode(std::string str) {
    char * escaped = curl_easy_escape(nullptr, str.c_str(), (int)str.size());
    if (escaped == nullptr) {
        return "";
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

bool MailUtils::isBlobId(const std::string & str) {
    static const std::regex re("^[a-f0-9]{64}$");
    return std::regex_match(str, re);
}

bool MailUtils::isAccountId(const std::string & str) {
    static const std::regex re("^[a-zA-Z0-9._-]{1,128}$");
    return std::regex_match(str, re);
}

std::string MailUtils::utf8Prefix(const std::string & str, size_t maxBytes) {
    if (str.size() <= maxBytes) {
        return str;
    }
    size_t end = maxBytes;
    while (end > 0 && (((unsigned char)str[end]) & 0xC0) == 0x80) {
        end--;
    }
    return str.substr(0, end);
}

std::string MailUtils::normalizeMessageId(std::string id) {
    std::string trimmed = trim(id);
    if (trimmed.size() > 2 && trimmed.front() == '<' && trimmed.back() == '>') {
        return trimmed.substr(1, trimmed.size() - 2);
    }
    return trimmed;
}

std::vector<std::string> MailUtils::parseReferences(std::string header) {
    std::vector<std::string> ids;
    static const std::regex bracketed("<[^>]+>");
    for (auto it = std::sregex_iterator(header.begin(), header.end(), bracketed); it != std::sregex_iterator(); ++it) {
        std::string norm = normalizeMessageId(it->str());
        if (norm != "") {
            ids.push_back(norm);
        }
    }
    if (ids.size() > 0) {
        return ids;
    }

    size_t pos = 0;
    while (pos < header.size()) {
        while (pos < header.size() && isspace((unsigned char)header[pos])) {
            pos++;
        }
        size_t end = pos;
        while (end < header.size() && !isspace((unsigned char)header[end])) {
            end++;
        }
        if (end > pos) {
            std::string norm = normalizeMessageId(header.substr(pos, end - pos));
            if (norm != "") {
                ids.push_back(norm);
            }
        }
        pos = end;
    }
    return ids;
}

std::string MailUtils::qmarks(size_t count) {
    if (count == 0) {
        return "";
    }
    std::string qmarks{"?"};
    for (size_t i = 1; i < count; i ++) {
        qmarks = qmarks + ",?";
    }
    return qmarks;
}
