#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "correction/offset_model.hpp"

namespace puv {

enum class ModelLoadState {
    NotStarted,
    Loading,
    Ready,
    Error,
};

const char* modelLoadStateName(ModelLoadState state);

struct ModelStatus {
    ModelLoadState state{ModelLoadState::NotStarted};
    std::string error;
};

// Loads the offset model on a background thread exactly once per start/reload.
// status() never blocks behind a load in progress.
class ModelLoader {
public:
    using Factory = std::function<std::shared_ptr<OffsetModel>(std::string& error)>;

    explicit ModelLoader(Factory factory);
    ~ModelLoader();

    ModelLoader(const ModelLoader&) = delete;
    ModelLoader& operator=(const ModelLoader&) = delete;

    // No-op unless the state is NotStarted.
    void start();
    // Back to NotStarted, dropping the current model. Refused while a load is running.
    bool reset();
    // reset() followed by start(); false while a load is running.
    bool reload();

    ModelStatus status() const;
    std::shared_ptr<OffsetModel> model() const;
    bool waitReady(int timeout_ms, std::string& error) const;
    int loadAttempts() const { return load_attempts_.load(); }

private:
    void loadWorker();

    Factory factory_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    ModelLoadState state_{ModelLoadState::NotStarted};
    std::string error_;
    std::shared_ptr<OffsetModel> model_;
    std::thread worker_;
    std::atomic<int> load_attempts_{0};
};

}  // namespace puv
