/** SesTransport [MailJMAP]
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

#ifndef SesTransport_hpp
#define SesTransport_hpp

#include <stdio.h>
#include <string>

#include "nlohmann/json.hpp"

#include "mailjmap/blob_store.hpp"
#include "mailjmap/outbound_transport.hpp"
#include "mailjmap/server_config.hpp"

/**
 * Sends raw MIME through the Amazon SES v2 outbound-emails API. The account,
 * submission and email ids travel as EmailTags so that SNS notifications can
 * be matched back to the submission.
 */
class SesTransport : public OutboundTransport {
    ServerConfig * config;
    BlobStore * blobs;

public:
    SesTransport(ServerConfig * config, BlobStore * blobs);

    OutboundDeliveryResult send(const OutboundMessage & message) override;

    static nlohmann::json buildPayload(const OutboundMessage & message, const std::string & rawBytes);
};

#endif /* SesTransport_hpp */
