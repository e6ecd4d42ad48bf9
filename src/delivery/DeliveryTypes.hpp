#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>

namespace coderun {
namespace delivery {

class DeliveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class DeliveryScope {
    Private,
    Group
};

/**
 * Where produced files go: a private conversation or a group
 */
struct DeliveryTarget {
    DeliveryScope scope = DeliveryScope::Private;
    std::string recipientId;

    /// "private:ID" or "group:ID"; throws std::invalid_argument
    static DeliveryTarget parse(const std::string& text);
    std::string toString() const;
};

/**
 * One file handed to the chat side
 */
struct FileMessage {
    std::string path;       // absolute path on this host
    std::string name;       // file name shown to the recipient
    std::string url;        // set by local-route delivery
    bool isImage = false;
    DeliveryTarget target;
};

/// Receives FileMessages on behalf of the chat collaborator
using FileSink = std::function<void(const FileMessage&)>;

struct DeliveryReport {
    std::string path;
    bool delivered = false;
    std::string strategy;
    std::string detail;     // URL, remote reply or failure reason

    nlohmann::json toJson() const;
};

/// png, jpg, jpeg, gif, bmp (case-insensitive)
bool isImageFile(const std::string& path);

} // namespace delivery
} // namespace coderun
