/** SnsVerifier [MailJMAP]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SnsVerifier_hpp
#define SnsVerifier_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <string>

#include <openssl/evp.h>

#include "nlohmann/json.hpp"

/**
 * Public keys of SNS signing certificates, keyed by certificate URL. The
 * cache only downloads from https URLs on an *.sns.*.amazonaws.com host.
 * Call invalidate() whenever the webhook configuration changes.
 */
class SnsCertificateCache {
    std::map<std::string, std::shared_ptr<EVP_PKEY>> keys;

public:
    virtual ~SnsCertificateCache() = default;

    static bool isTrustedCertificateURL(std::string url);
    static std::shared_ptr<EVP_PKEY> keyFromPEM(const std::string & pem);

    // nullptr when the URL is untrusted or the certificate cannot be loaded.
    std::shared_ptr<EVP_PKEY> keyForURL(std::string url);

    void insert(std::string url, std::shared_ptr<EVP_PKEY> key);
    void invalidate();
    size_t size();

protected:
    // Returns the PEM body. Throws SyncException on network failures.
    virtual std::string downloadCertificate(std::string url);
};

class SnsVerifier {
public:
    // The "key\nvalue\n" string SNS signs, or "" when a required field is missing.
    static std::string canonicalString(const nlohmann::json & sns);

    // SignatureVersion 1 (RSA-SHA1) only.
    static bool verify(const nlohmann::json & sns, SnsCertificateCache * certificates);
};

#endif /* SnsVerifier_hpp */
