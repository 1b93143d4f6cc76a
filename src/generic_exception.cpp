#include "mailjmap/generic_exception.hpp"

int GenericException::httpStatus() {
    return 500;
}

nlohmann::json GenericException::toJSON() {
    return {{"what", what()}};
}
