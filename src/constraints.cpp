#include "objgate/constraints.hpp"

namespace objgate {

std::optional<net::Response> ObjectConstraints::check_object_creation(
    const std::string& object_name, uint64_t length) const {
    if (object_name.empty()) {
        return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                                   "Object name cannot be empty");
    }

    if (object_name.size() > max_object_name_length_) {
        return net::Response::make(
            net::status_code(net::HttpStatus::BadRequest),
            "Object name length of " + std::to_string(object_name.size()) +
                " longer than " + std::to_string(max_object_name_length_));
    }

    if (length > max_file_size_) {
        return net::Response::make(net::status_code(net::HttpStatus::PayloadTooLarge),
                                   "Your request is too large.");
    }

    return std::nullopt;
}

}  // namespace objgate
