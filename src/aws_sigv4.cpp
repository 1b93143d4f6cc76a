#include "mailjmap/aws_sigv4.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/sync_exception.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

std::string AwsSigV4::hmacSha256(const std::string & key, const std::string & data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLength = 0;
    unsigned char * result = HMAC(EVP_sha256(), key.data(), (int)key.size(), reinterpret_cast<const unsigned char *>(data.data()), data.size(), out, &outLength);
    if (result == nullptr) {
        throw SyncException("sigv4", "HMAC-SHA256 failed", false);
    }
    return std::string(reinterpret_cast<char *>(out), outLength);
}

void AwsSigV4::splitURL(std::string url, std::string & host, std::string & path) {
    size_t scheme = url.find("://");
    if (scheme == std::string::npos) {
        throw SyncException("sigv4", "Invalid URL " + url, false);
    }
    std::string rest = url.substr(scheme + 3);
    size_t slash = rest.find('/');
    host = slash == std::string::npos ? rest : rest.substr(0, slash);
    path = slash == std::string::npos ? "/" : rest.substr(slash);
    size_t query = path.find('?');
    if (query != std::string::npos) {
        path = path.substr(0, query);
    }
    if (host == "") {
        throw SyncException("sigv4", "Invalid URL " + url, false);
    }
}

std::map<std::string, std::string> AwsSigV4::sign(std::string method, std::string url, const std::string & body, const AwsCredentials & credentials, time_t now) {
    std::string host;
    std::string path;
    splitURL(url, host, path);

    struct tm ptm;
    gmtime_r(&now, &ptm);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &ptm);
    std::string amzDate(buffer);
    std::string dateStamp = amzDate.substr(0, 8);

    // std::map keeps the signed header names sorted
    std::map<std::string, std::string> headers = {
        {"content-type", "application/json"},
        {"host", host},
        {"x-amz-date", amzDate},
    };

    std::string canonicalHeaders = "";
    std::string signedHeaders = "";
    for (const auto & pair : headers) {
        canonicalHeaders += pair.first + ":" + MailUtils::trim(pair.second) + "\n";
        signedHeaders += (signedHeaders == "" ? "" : ";") + pair.first;
    }

    std::string payloadHash = MailUtils::sha256Hex(body);
    std::string canonicalRequest = MailUtils::toUpper(method) + "\n" + path + "\n" + "\n" + canonicalHeaders + "\n" + signedHeaders + "\n" + payloadHash;

    std::string credentialScope = dateStamp + "/" + credentials.region + "/" + credentials.service + "/aws4_request";
    std::string stringToSign = "AWS4-HMAC-SHA256\n" + amzDate + "\n" + credentialScope + "\n" + MailUtils::sha256Hex(canonicalRequest);

    std::string kDate = hmacSha256("AWS4" + credentials.secretAccessKey, dateStamp);
    std::string kRegion = hmacSha256(kDate, credentials.region);
    std::string kService = hmacSha256(kRegion, credentials.service);
    std::string kSigning = hmacSha256(kService, "aws4_request");
    std::string raw = hmacSha256(kSigning, stringToSign);
    std::string signature = MailUtils::toHex(reinterpret_cast<const unsigned char *>(raw.data()), raw.size());

    headers["authorization"] = "AWS4-HMAC-SHA256 Credential=" + credentials.accessKeyId + "/" + credentialScope + ", SignedHeaders=" + signedHeaders + ", Signature=" + signature;
    headers["x-amz-content-sha256"] = payloadHash;
    return headers;
}
