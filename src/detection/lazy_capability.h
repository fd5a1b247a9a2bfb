#pragma once

/// @file lazy_capability.h
/// @brief Single-flight lazy loading for optional model-backed signals

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "detection/signal.h"

namespace ipishield::detection {

/// @brief A value loaded on first use, exactly once per process
///
/// The first Get() runs the loader; concurrent callers block until it
/// finishes and then see the same outcome. A failed load leaves the
/// capability permanently unavailable and is never retried. The loaded
/// value is immutable and shared by every caller.
template <typename T>
class LazyCapability {
public:
    using Loader = std::function<absl::StatusOr<std::shared_ptr<const T>>()>;

    LazyCapability(std::string name, Loader loader)
        : name_(std::move(name)), loader_(std::move(loader)) {}

    LazyCapability(const LazyCapability&) = delete;
    LazyCapability& operator=(const LazyCapability&) = delete;

    /// @brief Load if needed and return the value
    /// @return ModelLoadError status if the capability is unavailable
    absl::StatusOr<std::shared_ptr<const T>> Get() {
        std::call_once(once_, [this] { Load(); });
        if (state_.load(std::memory_order_acquire) != Availability::kAvailable) {
            return status_;
        }
        return value_;
    }

    /// @brief Current lifecycle state; never triggers a load
    Availability State() const { return state_.load(std::memory_order_acquire); }

    const std::string& Name() const { return name_; }

private:
    void Load() {
        absl::StatusOr<std::shared_ptr<const T>> loaded =
            absl::UnknownError("loader did not run");
        try {
            if (loader_) {
                loaded = loader_();
            } else {
                loaded = absl::FailedPreconditionError("no loader configured");
            }
        } catch (const std::exception& e) {
            loaded = absl::InternalError(absl::StrCat("loader threw: ", e.what()));
        }

        if (loaded.ok() && *loaded != nullptr) {
            value_ = std::move(loaded).value();
            state_.store(Availability::kAvailable, std::memory_order_release);
            IPISHIELD_LOG_INFO("Capability '{}' loaded", name_);
            return;
        }

        status_ = loaded.ok()
            ? MakeError(ErrorCode::kModelLoadError, absl::StrCat(name_, ": loader returned null"))
            : MakeError(ErrorCode::kModelLoadError,
                        absl::StrCat(name_, ": ", loaded.status().message()));
        state_.store(Availability::kUnavailable, std::memory_order_release);
        IPISHIELD_LOG_WARN("Capability '{}' unavailable for the process lifetime: {}",
                           name_, std::string(status_.message()));
    }

    std::string name_;
    Loader loader_;
    std::once_flag once_;
    std::atomic<Availability> state_{Availability::kUninitialized};

    // Written once inside call_once, read-only afterwards
    std::shared_ptr<const T> value_;
    absl::Status status_;
};

}  // namespace ipishield::detection
