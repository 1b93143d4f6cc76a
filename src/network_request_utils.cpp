#include "mailjmap/network_request_utils.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/mail_utils.hpp"

#include <string.h>
#include <sys/stat.h>

std::string FindLinuxCertsBundle() {
#ifdef __linux__
    std::string certificatePaths[] = {
        // Debian, Ubuntu, Arch: maintained by update-ca-certificates
        "/etc/ssl/certs/ca-certificates.crt",
        // Red Hat 5+, Fedora, Centos
        "/etc/pki/tls/certs/ca-bundle.crt",
        // Red Hat 4
        "/usr/share/ssl/certs/ca-bundle.crt",
        // FreeBSD (security/ca-root-nss package)
        "/usr/local/share/certs/ca-root-nss.crt",
        // OpenBSD
        "/etc/ssl/cert.pem",
        // OpenSUSE
        "/etc/ssl/ca-bundle.pem",
    };
    for (const auto & path : certificatePaths) {
        struct stat buffer;
        if (stat (path.c_str(), &buffer) == 0) {
            return path;
        }
    }
#endif
    return "";
}

static size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    std::string * buffer = (std::string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    size_t newLength = oldLength + real_size;

    buffer->resize(newLength);
    std::copy((char*)contents, (char*)contents+real_size, buffer->begin() + oldLength);

    return real_size;
}

static size_t _onAppendHeader(char *buffer, size_t size, size_t nitems, void *userp) {
    auto * headers = (std::map<std::string, std::string> *)userp;
    size_t real_size = size * nitems;

    std::string line(buffer, real_size);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = MailUtils::toLower(MailUtils::trim(line.substr(0, colon)));
        (*headers)[name] = MailUtils::trim(line.substr(colon + 1));
    }
    return real_size;
}

CURL * CreateRequest(std::string url, std::string method, struct curl_slist * headers, const std::string * payload) {
    CURL * curl_handle = curl_easy_init();
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, 60);

    if (headers != nullptr) {
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    }
    if (payload != nullptr) {
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, payload->data());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, (long)payload->size());
    }
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, method.c_str());

    // Ensure /all/ curl code paths run this code for RHEL 7.6 and other linux distros
    std::string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }
    return curl_handle;
}

HTTPResponse PerformHTTPRequest(CURL * curl_handle, struct curl_slist * headers) {
    HTTPResponse response{0, "", {}};
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&response.body);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, _onAppendHeader);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERDATA, (void *)&response.headers);

    CURLcode res = curl_easy_perform(curl_handle);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &response.status);
    }

    std::string url = "";
    char * _url = nullptr;
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) == CURLE_OK && _url != nullptr) {
        url = std::string(_url);
    }
    curl_easy_cleanup(curl_handle);
    if (headers != nullptr) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        throw SyncException(res, url);
    }
    return response;
}
