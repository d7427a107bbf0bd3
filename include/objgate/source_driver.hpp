#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objgate {

// Why a driver could not be created or could not fetch an object
enum class DriverErrorKind {
    None,
    NotFound,       // object or directory absent upstream
    Connection,     // transport failure talking to the external store
    Unavailable,    // driver's native dependency missing at runtime
    InvalidParams,  // bad or missing migration parameters
    RemoteStatus,   // external store answered non-2xx
    Io,             // local read failure
    TooLarge        // object exceeds MAX_OBJECT_SIZE_PARAM
};

const char* driver_error_kind_name(DriverErrorKind kind);

/// Required key values from container metadata plus the provider's static
/// parameters from the registry ("driver_<name>_<param>" keys).
using MigrationParams = std::map<std::string, std::string>;

/// Largest object, in bytes, a driver may hand back. Drivers refuse bigger
/// objects before buffering them.
constexpr const char* MAX_OBJECT_SIZE_PARAM = "max_object_size";

/// MAX_OBJECT_SIZE_PARAM from `params`; nullopt when absent or not a number.
std::optional<uint64_t> max_object_size(const MigrationParams& params);

// An object read from an external source
struct SourceObject {
    // Metadata to carry over as object user metadata. Keys already carrying
    // the X-Object-Meta- prefix are kept as they are.
    std::map<std::string, std::string> metadata;
    // Size the source reports for the object. On a TooLarge failure it is
    // the refused size when the source told it.
    std::optional<uint64_t> size;
    // Absent when the driver has no byte stream for the name
    std::optional<std::vector<uint8_t>> data;
    std::string content_type;
    // Seconds since the epoch, as reported by the source
    std::optional<double> timestamp;
};

// Result of a get_object operation
struct FetchResult {
    bool success = false;
    SourceObject object;
    DriverErrorKind error_kind = DriverErrorKind::None;
    std::string error_message;

    static FetchResult failure(DriverErrorKind kind, const std::string& message) {
        FetchResult result;
        result.error_kind = kind;
        result.error_message = message;
        return result;
    }
};

// Abstract interface for migration source drivers. One instance serves one
// migration attempt.
class SourceDriver {
public:
    virtual ~SourceDriver() = default;

    // Driver type name (for logging)
    virtual std::string type_name() const = 0;

    // Read an object from the external source
    virtual FetchResult get_object(const std::string& object_name) = 0;

    // Release whatever get_object acquired. Called exactly once per driver.
    virtual void finalize() {}
};

/// Calls finalize() on a driver when the scope ends, however it ends.
class DriverGuard {
public:
    explicit DriverGuard(SourceDriver& driver) : driver_(driver) {}
    ~DriverGuard() { driver_.finalize(); }

    DriverGuard(const DriverGuard&) = delete;
    DriverGuard& operator=(const DriverGuard&) = delete;

private:
    SourceDriver& driver_;
};

// Result of creating a driver for one migration attempt
struct DriverCreateResult {
    bool success = false;
    std::unique_ptr<SourceDriver> driver;
    DriverErrorKind error_kind = DriverErrorKind::None;
    std::string error_message;

    static DriverCreateResult ok(std::unique_ptr<SourceDriver> driver) {
        DriverCreateResult result;
        result.success = true;
        result.driver = std::move(driver);
        return result;
    }

    static DriverCreateResult failure(DriverErrorKind kind, const std::string& message) {
        DriverCreateResult result;
        result.error_kind = kind;
        result.error_message = message;
        return result;
    }
};

/// Constructor plus availability probe for one driver type.
struct DriverFactory {
    std::function<DriverCreateResult(const std::string& source,
                                     const MigrationParams& params)> create;
    // Whether the driver's native dependency is usable in this process
    std::function<bool()> available;
};

// Built-in driver types
class SourceDriverFactory {
public:
    /// Objects under <driver_fsystem_parent_path>/<source>/.
    static DriverCreateResult create_fsystem(const std::string& source,
                                             const MigrationParams& params);

    /// Objects in container <source> of a Swift-compatible store (auth v1).
    /// Keys: token-url, user, key.
    static DriverCreateResult create_swift(const std::string& source,
                                           const MigrationParams& params);

    /// Objects in bucket <source> of an S3-compatible store.
    /// Keys: endpoint, region, access-key, secret-key.
    static DriverCreateResult create_s3(const std::string& source,
                                        const MigrationParams& params);

    /// True when the HTTP client can reach remote stores.
    static bool remote_available();

    /// Factories for "fsystem", "swift" and "s3".
    static std::map<std::string, DriverFactory> builtin_factories();
};

/// Best-effort MIME type from a file name's extension, empty if unknown.
std::string guess_content_type(const std::string& name);

}  // namespace objgate
