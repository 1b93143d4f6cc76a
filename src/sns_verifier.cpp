#include "mailjmap/sns_verifier.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/network_request_utils.hpp"
#include "mailjmap/sync_exception.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include "spdlog/spdlog.h"

static bool stringField(const nlohmann::json & sns, const char * key, std::string & out) {
    if (!sns.count(key) || !sns[key].is_string()) {
        return false;
    }
    out = sns[key].get<std::string>();
    return true;
}

bool SnsCertificateCache::isTrustedCertificateURL(std::string url) {
    std::string prefix = "https://";
    if (url.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    std::string rest = url.substr(prefix.size());
    size_t end = rest.find_first_of("/?#");
    std::string host = MailUtils::toLower(rest.substr(0, end));
    if (host.find('@') != std::string::npos) {
        return false;
    }
    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        host = host.substr(0, colon);
    }
    std::string suffix = ".amazonaws.com";
    if (host.size() <= suffix.size() || host.compare(host.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    return host.find(".sns.") != std::string::npos;
}

std::shared_ptr<EVP_PKEY> SnsCertificateCache::keyFromPEM(const std::string & pem) {
    BIO * bio = BIO_new_mem_buf(pem.data(), (int)pem.size());
    if (!bio) {
        return nullptr;
    }
    X509 * cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!cert) {
        return nullptr;
    }
    EVP_PKEY * key = X509_get_pubkey(cert);
    X509_free(cert);
    if (!key) {
        return nullptr;
    }
    return std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);
}

std::string SnsCertificateCache::downloadCertificate(std::string url) {
    CURL * curl = CreateRequest(url, "GET", nullptr);
    HTTPResponse response = PerformHTTPRequest(curl);
    if (response.status < 200 || response.status >= 300) {
        throw SyncException("sns-certificate", "Certificate download returned " + std::to_string(response.status), true);
    }
    return response.body;
}

std::shared_ptr<EVP_PKEY> SnsCertificateCache::keyForURL(std::string url) {
    if (!isTrustedCertificateURL(url)) {
        spdlog::get("logger")->warn("Refusing SNS certificate from untrusted URL {}", url);
        return nullptr;
    }
    auto cached = keys.find(url);
    if (cached != keys.end()) {
        return cached->second;
    }

    std::string pem;
    try {
        pem = downloadCertificate(url);
    } catch (SyncException & ex) {
        spdlog::get("logger")->error("Failed to download SNS certificate {}: {}", url, ex.debuginfo);
        return nullptr;
    }
    auto key = keyFromPEM(pem);
    if (key == nullptr) {
        spdlog::get("logger")->error("Failed to parse SNS certificate {}", url);
        return nullptr;
    }
    keys[url] = key;
    return key;
}

void SnsCertificateCache::insert(std::string url, std::shared_ptr<EVP_PKEY> key) {
    keys[url] = key;
}

void SnsCertificateCache::invalidate() {
    keys.clear();
}

size_t SnsCertificateCache::size() {
    return keys.size();
}

std::string SnsVerifier::canonicalString(const nlohmann::json & sns) {
    if (!sns.is_object()) {
        return "";
    }
    std::string type;
    if (!stringField(sns, "Type", type)) {
        return "";
    }

    std::vector<const char *> required;
    if (type == "Notification") {
        required = {"Message", "MessageId", "Subject", "Timestamp", "TopicArn", "Type"};
    } else if (type == "SubscriptionConfirmation" || type == "UnsubscribeConfirmation") {
        required = {"Message", "MessageId", "SubscribeURL", "Timestamp", "Token", "TopicArn", "Type"};
    } else {
        return "";
    }

    std::string result;
    for (const char * key : required) {
        std::string value;
        if (!stringField(sns, key, value) || value == "") {
            // Subject is the one optional field
            if (std::string(key) == "Subject") {
                continue;
            }
            return "";
        }
        result += std::string(key) + "\n" + value + "\n";
    }
    return result;
}

bool SnsVerifier::verify(const nlohmann::json & sns, SnsCertificateCache * certificates) {
    std::string version;
    std::string signature;
    std::string certURL;
    if (!sns.is_object() || !stringField(sns, "SignatureVersion", version) || version != "1") {
        return false;
    }
    if (!stringField(sns, "Signature", signature)) {
        return false;
    }
    // HTTP deliveries spell it SigningCertURL, Lambda-style records SigningCertUrl
    if (!stringField(sns, "SigningCertURL", certURL) && !stringField(sns, "SigningCertUrl", certURL)) {
        return false;
    }

    std::string canonical = canonicalString(sns);
    if (canonical == "") {
        return false;
    }
    auto key = certificates->keyForURL(certURL);
    if (key == nullptr) {
        return false;
    }
    std::string signatureBytes;
    try {
        signatureBytes = MailUtils::fromBase64(signature);
    } catch (SyncException & ex) {
        spdlog::get("logger")->warn("SNS signature is not base64: {}", ex.debuginfo);
        return false;
    }
    if (signatureBytes.size() == 0) {
        return false;
    }

    EVP_MD_CTX * ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return false;
    }
    bool ok = EVP_DigestVerifyInit(ctx, nullptr, EVP_sha1(), nullptr, key.get()) == 1
        && EVP_DigestVerifyUpdate(ctx, canonical.data(), canonical.size()) == 1
        && EVP_DigestVerifyFinal(ctx, (const unsigned char *)signatureBytes.data(), signatureBytes.size()) == 1;
    EVP_MD_CTX_free(ctx);
    return ok;
}
