#pragma once

#include "objgate/net/http.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace objgate {

// Default limits for object creation
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 5ULL * 1024 * 1024 * 1024 + 2;
constexpr size_t DEFAULT_MAX_OBJECT_NAME_LENGTH = 1024;

/// Object creation limits shared by the copy and migration paths.
class ObjectConstraints {
public:
    ObjectConstraints() = default;
    ObjectConstraints(uint64_t max_file_size, size_t max_object_name_length)
        : max_file_size_(max_file_size)
        , max_object_name_length_(max_object_name_length) {}

    /// Returns the client error to send when an object called `object_name`
    /// of `length` bytes may not be created, or nullopt when it may.
    /// 400 for an empty or over-long name, 413 for an oversized body.
    std::optional<net::Response> check_object_creation(const std::string& object_name,
                                                       uint64_t length) const;

    uint64_t max_file_size() const { return max_file_size_; }
    size_t max_object_name_length() const { return max_object_name_length_; }

private:
    uint64_t max_file_size_ = DEFAULT_MAX_FILE_SIZE;
    size_t max_object_name_length_ = DEFAULT_MAX_OBJECT_NAME_LENGTH;
};

}  // namespace objgate
