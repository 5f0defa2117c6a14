#pragma once

#include <any>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace segmux::core {

// Values captured by wildcard path segments, in root-to-leaf order.
using PathParameters = std::vector<std::string>;

// Key under which HttpRouter stores the PathParameters of a request.
inline const std::string kPathParametersKey = "segmux.path_parameters";

class RequestContext {
public:
    RequestContext() = default;

    // --- request id ---
    const std::string& request_id() const noexcept;
    void set_request_id(std::string id);

    // --- generic storage ---
    template<typename T>
    void set(std::string key, T value) {
        data_[std::move(key)] = std::any(std::move(value));
    }

    template<typename T>
    T* get(const std::string& key) {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    template<typename T>
    const T* get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    bool contains(const std::string& key) const;

private:
    std::string request_id_;
    std::unordered_map<std::string, std::any> data_;
};

// All wildcard captures of the current request. Empty when the router
// stored none.
PathParameters path_parameters(const RequestContext& context);

// Capture at `index`, or an empty string when there is no such capture.
std::string path_parameter(const RequestContext& context, std::size_t index);

} // namespace segmux::core
