#ifndef MOCKOUTBOUNDTRANSPORT_HPP
#define MOCKOUTBOUNDTRANSPORT_HPP

#include <gmock/gmock.h>
#include <string>
#include <vector>

#include "mailjmap/outbound_transport.hpp"

class MockOutboundTransport : public OutboundTransport {
public:
    MOCK_METHOD(OutboundDeliveryResult, send, (const OutboundMessage & message), (override));

    static OutboundDeliveryResult accepted(std::string providerMessageId = "ses-message-1") {
        return OutboundDeliveryResult{OUTBOUND_STATUS_ACCEPTED, providerMessageId, "request-1", "", false};
    }

    static OutboundDeliveryResult rejected(std::string reason, bool permanent) {
        return OutboundDeliveryResult{OUTBOUND_STATUS_REJECTED, "", "request-1", reason, permanent};
    }
};

#endif /* MOCKOUTBOUNDTRANSPORT_HPP */
