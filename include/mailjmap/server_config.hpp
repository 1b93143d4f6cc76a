/** ServerConfig [MailJMAP]
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

#ifndef ServerConfig_hpp
#define ServerConfig_hpp

#include <stdio.h>
#include <string>

#include "nlohmann/json.hpp"

class ServerConfig {
public:
    std::string dataDir;
    std::string blobDir;
    std::string databaseFile;

    long long maxSizeUpload;
    long long maxSizeAttachmentsPerEmail;
    int maxMailboxesPerEmail;
    int schedulerBatchSize;
    int orphanBlobGraceSeconds;
    std::string mailDomain;

    std::string sesRegion;
    std::string sesAccessKeyId;
    std::string sesSecretAccessKey;
    std::string sesEndpoint;
    std::string sesWebhookToken;
    std::string sesTopicArn;

    ServerConfig();

    // Reads a config.json file. Missing keys keep their defaults.
    static ServerConfig FromFile(std::string path);
    static ServerConfig FromJSON(const nlohmann::json & json, std::string dataDir);

    // MAILJMAP_SES_* environment variables win over the file.
    void applyEnvironment();

    std::string databasePath();

    // sesEndpoint when set, otherwise the regional SESv2 outbound-emails URL.
    std::string sesOutboundURL();

    nlohmann::json toJSON();
};

#endif /* ServerConfig_hpp */
