#include "correction/model_loader.hpp"

#include <chrono>
#include <iostream>

namespace puv {

const char* modelLoadStateName(ModelLoadState state) {
    switch (state) {
        case ModelLoadState::NotStarted:
            return "not_started";
        case ModelLoadState::Loading:
            return "loading";
        case ModelLoadState::Ready:
            return "ready";
        case ModelLoadState::Error:
            return "error";
    }
    return "unknown";
}

ModelLoader::ModelLoader(Factory factory) : factory_(std::move(factory)) {}

ModelLoader::~ModelLoader() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void ModelLoader::start() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ModelLoadState::NotStarted) {
            return;
        }
        state_ = ModelLoadState::Loading;
        error_.clear();
        previous = std::move(worker_);
        worker_ = std::thread(&ModelLoader::loadWorker, this);
    }
    // A finished worker from an earlier cycle; it no longer touches state.
    if (previous.joinable()) {
        previous.join();
    }
}

bool ModelLoader::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ModelLoadState::Loading) {
        return false;
    }
    state_ = ModelLoadState::NotStarted;
    error_.clear();
    model_.reset();
    return true;
}

bool ModelLoader::reload() {
    if (!reset()) {
        return false;
    }
    start();
    return true;
}

ModelStatus ModelLoader::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ModelStatus{state_, error_};
}

std::shared_ptr<OffsetModel> ModelLoader::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ModelLoadState::Ready ? model_ : nullptr;
}

bool ModelLoader::waitReady(int timeout_ms, std::string& error) const {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool settled = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return state_ == ModelLoadState::Ready || state_ == ModelLoadState::Error;
    });
    if (!settled) {
        error = std::string("model still ") + modelLoadStateName(state_);
        return false;
    }
    if (state_ == ModelLoadState::Error) {
        error = error_;
        return false;
    }
    error.clear();
    return true;
}

void ModelLoader::loadWorker() {
    load_attempts_.fetch_add(1);
    std::string error;
    std::shared_ptr<OffsetModel> loaded;
    try {
        loaded = factory_ ? factory_(error) : nullptr;
        if (!loaded && error.empty()) {
            error = "model factory returned no model";
        }
    } catch (const std::exception& e) {
        loaded.reset();
        error = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loaded) {
            model_ = std::move(loaded);
            state_ = ModelLoadState::Ready;
            error_.clear();
        } else {
            model_.reset();
            state_ = ModelLoadState::Error;
            error_ = error;
        }
    }
    cv_.notify_all();

    if (error.empty()) {
        std::cout << "[model] ready\n";
    } else {
        std::cerr << "[model] load failed: " << error << '\n';
    }
}

}  // namespace puv
