#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "core/context.hpp"
#include "core/debouncer.hpp"
#include "io/path_inspector.hpp"
#include "model/app_config.hpp"

namespace cloudlink::core {

enum class FieldStatus {
    Empty,
    Valid,
    // Usable, but outside the cloud folder.
    Warning,
    Invalid,
};

const char *fieldStatusName(FieldStatus status);

struct FieldResult {
    FieldStatus status = FieldStatus::Empty;
    std::string message;
};

using FieldCallback = std::function<void(const FieldResult &)>;

// Validation for paths typed into an interactive field. Each field is debounced on its own;
// callbacks run on the debouncer thread.
class LiveValidator {
public:
    LiveValidator(
        const io::PathInspector &inspector,
        model::Settings settings,
        const cloudlink::Context &ctx,
        std::chrono::milliseconds delay = std::chrono::milliseconds(500),
        std::chrono::milliseconds cacheTtl = std::chrono::milliseconds(5000)
    );

    void validateSource(const std::string &field, const std::string &path, FieldCallback callback);
    void validateTarget(const std::string &field, const std::string &path, FieldCallback callback);
    void cancel(const std::string &field);

    // Synchronous variants, cached the same way.
    FieldResult checkSource(const std::string &path);
    FieldResult checkTarget(const std::string &path);

    std::size_t pending() const { return debouncer_.pending(); }

private:
    struct CachedResult {
        FieldResult result;
        Debouncer::Clock::time_point at;
    };

    bool cached(const std::string &key, FieldResult &out);
    void remember(const std::string &key, const FieldResult &result);

    const io::PathInspector &inspector_;
    model::Settings settings_;
    const cloudlink::Context &ctx_;
    std::chrono::milliseconds delay_;
    std::chrono::milliseconds cacheTtl_;

    std::mutex cacheMutex_;
    std::map<std::string, CachedResult> cache_;

    Debouncer debouncer_;
};

} // namespace cloudlink::core
