/** OutboundTransport [MailJMAP]
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

#ifndef OutboundTransport_hpp
#define OutboundTransport_hpp

#include <stdio.h>
#include <string>
#include <vector>

#define OUTBOUND_STATUS_ACCEPTED  "accepted"
#define OUTBOUND_STATUS_REJECTED  "rejected"
#define OUTBOUND_STATUS_FAILED    "failed"

struct OutboundEnvelope {
    std::string mailFrom;
    std::vector<std::string> rcptTo;
};

// Raw MIME is either carried inline or referenced by blob hash.
struct OutboundMimeRef {
    bool isInline;
    std::string raw;
    std::string sha256;
    size_t size;
};

struct OutboundMessage {
    std::string accountId;
    std::string submissionId;
    std::string emailId;
    OutboundEnvelope envelope;
    OutboundMimeRef mime;
};

struct OutboundDeliveryResult {
    std::string status;
    std::string providerMessageId;
    std::string providerRequestId;
    std::string reason;
    bool permanent;
};

/**
 * Hands a message to an outbound provider. Returning a result means the
 * provider answered; throwing means the attempt could not be made at all and
 * the queue treats it as transient.
 */
class OutboundTransport {
public:
    virtual ~OutboundTransport() = default;
    virtual OutboundDeliveryResult send(const OutboundMessage & message) = 0;
};

#endif /* OutboundTransport_hpp */
