#include "mailjmap/jmap_error.hpp"

JMAPError::JMAPError(std::string type, std::string description, std::vector<std::string> properties) :
    type(type), description(description), properties(properties)
{
}

int JMAPError::httpStatus() {
    if (type == "alreadyExists") {
        return 409;
    }
    if (type == "accountNotFound") {
        return 404;
    }
    return 400;
}

const char * JMAPError::what() const noexcept {
    return description.size() ? description.c_str() : type.c_str();
}

nlohmann::json JMAPError::toJSON() {
    nlohmann::json err = {{"type", type}};
    if (description != "") {
        err["description"] = description;
    }
    if (properties.size()) {
        err["properties"] = properties;
    }
    return err;
}
