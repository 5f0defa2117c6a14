#include "segmux/core/request_context.h"

namespace segmux::core {

const std::string& RequestContext::request_id() const noexcept {
    return request_id_;
}

void RequestContext::set_request_id(std::string id) {
    request_id_ = std::move(id);
}

bool RequestContext::contains(const std::string& key) const {
    return data_.find(key) != data_.end();
}

PathParameters path_parameters(const RequestContext& context) {
    const auto* parameters = context.get<PathParameters>(kPathParametersKey);
    if (parameters == nullptr) {
        return {};
    }
    return *parameters;
}

std::string path_parameter(const RequestContext& context, std::size_t index) {
    const auto* parameters = context.get<PathParameters>(kPathParametersKey);
    if (parameters == nullptr || index >= parameters->size()) {
        return {};
    }
    return (*parameters)[index];
}

} // namespace segmux::core
