#include "core/live_validator.hpp"

#include <utility>

#include "core/path_checks.hpp"
#include "io/output_cleanup.hpp"

namespace fs = std::filesystem;

namespace cloudlink::core
{

    const char *fieldStatusName(FieldStatus status)
    {
        switch (status)
        {
        case FieldStatus::Empty:
            return "empty";
        case FieldStatus::Valid:
            return "valid";
        case FieldStatus::Warning:
            return "warning";
        case FieldStatus::Invalid:
            return "invalid";
        }
        return "unknown";
    }

    LiveValidator::LiveValidator(
        const io::PathInspector &inspector,
        model::Settings settings,
        const cloudlink::Context &ctx,
        std::chrono::milliseconds delay,
        std::chrono::milliseconds cacheTtl)
        : inspector_(inspector), settings_(std::move(settings)), ctx_(ctx), delay_(delay), cacheTtl_(cacheTtl), debouncer_(ctx)
    {
    }

    void LiveValidator::validateSource(const std::string &field, const std::string &path, FieldCallback callback)
    {
        debouncer_.submit(field, delay_, [this, path, callback]()
                          {
                              const FieldResult result = checkSource(path);
                              if (callback)
                              {
                                  callback(result);
                              } });
    }

    void LiveValidator::validateTarget(const std::string &field, const std::string &path, FieldCallback callback)
    {
        debouncer_.submit(field, delay_, [this, path, callback]()
                          {
                              const FieldResult result = checkTarget(path);
                              if (callback)
                              {
                                  callback(result);
                              } });
    }

    void LiveValidator::cancel(const std::string &field)
    {
        debouncer_.cancel(field);
    }

    FieldResult LiveValidator::checkSource(const std::string &path)
    {
        const std::string trimmed = io::trimCopy(path);
        if (trimmed.empty())
        {
            return FieldResult{FieldStatus::Empty, "empty"};
        }

        const std::string key = "source:" + path;
        FieldResult result;
        if (cached(key, result))
        {
            return result;
        }

        Status status = Status::success();
        if (inspector_.isJunction(trimmed))
        {
            status = Status::failure(ErrorKind::Validation, "Source path is already a junction link", {trimmed});
        }
        else
        {
            status = checkSourcePath(inspector_, settings_, trimmed);
        }

        if (status)
        {
            result = FieldResult{FieldStatus::Valid, ""};
        }
        else
        {
            result = FieldResult{FieldStatus::Invalid, status.message()};
            ctx_.debug("Source validation failed: ", status.message());
        }
        remember(key, result);
        return result;
    }

    FieldResult LiveValidator::checkTarget(const std::string &path)
    {
        const std::string trimmed = io::trimCopy(path);
        if (trimmed.empty())
        {
            return FieldResult{FieldStatus::Empty, "empty"};
        }

        const std::string key = "target:" + path;
        FieldResult result;
        if (cached(key, result))
        {
            return result;
        }

        const Status status = checkTargetPath(inspector_, settings_, trimmed);
        if (!status)
        {
            result = FieldResult{FieldStatus::Invalid, status.message()};
            ctx_.debug("Target validation failed: ", status.message());
            remember(key, result);
            return result;
        }

        if (!settings_.cloudRoot.empty() && !isWithin(inspector_.canonical(trimmed), inspector_.canonical(settings_.cloudRoot)))
        {
            // Warnings are not cached.
            return FieldResult{FieldStatus::Warning, "Target is outside the cloud folder " + settings_.cloudRoot.string()};
        }

        result = FieldResult{FieldStatus::Valid, ""};
        remember(key, result);
        return result;
    }

    bool LiveValidator::cached(const std::string &key, FieldResult &out)
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = cache_.find(key);
        if (it == cache_.end())
        {
            return false;
        }
        if (Debouncer::Clock::now() - it->second.at >= cacheTtl_)
        {
            cache_.erase(it);
            return false;
        }
        out = it->second.result;
        return true;
    }

    void LiveValidator::remember(const std::string &key, const FieldResult &result)
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_[key] = CachedResult{result, Debouncer::Clock::now()};
    }

} // namespace cloudlink::core
