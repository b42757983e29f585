#include "common/job.hpp"
#include "common/logger.hpp"
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() : createdAt_(std::chrono::system_clock::now()) {}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Job::isTerminal() const {
    State state = getState();
    return state == State::Finished || state == State::Aborted;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

std::string Job::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool Job::isValidTransition(State from, State to) {
    switch (from) {
        case State::Created:
            return to == State::Active || to == State::Aborted;
        case State::Active:
            return to == State::Finishing || to == State::Aborted;
        case State::Finishing:
            return to == State::Finished || to == State::Aborted;
        case State::Finished:
        case State::Aborted:
            return false;
    }
    return false;
}

bool Job::transitionTo(State next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isValidTransition(state_, next)) {
        return false;
    }
    Logger::debug("Job " + id_ + ": " + jobStatusToString(state_) + " -> " + jobStatusToString(next));
    state_ = next;
    return true;
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

void Job::setId(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_ = id;
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}
