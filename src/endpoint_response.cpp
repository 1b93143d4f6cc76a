#include "mailjmap/endpoint_response.hpp"
#include "mailjmap/mail_utils.hpp"

nlohmann::json EndpointResponse::toJSON() const {
    nlohmann::json json = {{"status", status}};
    if (!body.is_null()) {
        json["body"] = body;
    }
    if (headers.size()) {
        json["headers"] = headers;
    }
    if (hasData) {
        json["dataBase64"] = MailUtils::toBase64(data.data(), data.size());
    }
    return json;
}
