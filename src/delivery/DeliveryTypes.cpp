#include "delivery/DeliveryTypes.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace coderun {
namespace delivery {

DeliveryTarget DeliveryTarget::parse(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon + 1 >= text.size()) {
        throw std::invalid_argument("Delivery target must be private:ID or group:ID, got '" + text + "'");
    }

    std::string scope = text.substr(0, colon);
    DeliveryTarget target;
    target.recipientId = text.substr(colon + 1);
    if (scope == "private") {
        target.scope = DeliveryScope::Private;
    } else if (scope == "group") {
        target.scope = DeliveryScope::Group;
    } else {
        throw std::invalid_argument("Unknown delivery scope: " + scope);
    }
    return target;
}

std::string DeliveryTarget::toString() const {
    return (scope == DeliveryScope::Group ? "group:" : "private:") + recipientId;
}

nlohmann::json DeliveryReport::toJson() const {
    return {
        {"path", path},
        {"delivered", delivered},
        {"strategy", strategy},
        {"detail", detail}
    };
}

bool isImageFile(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".gif" || ext == ".bmp";
}

} // namespace delivery
} // namespace coderun
