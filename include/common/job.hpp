#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include "common/backup_status.hpp"

// State holder shared by all job types. The state only moves forward:
//   Created -> Active -> Finishing -> Finished
// and from every non terminal state to Aborted.
class Job {
public:
    using State = JobStatus;

    Job();
    virtual ~Job() = default;

    virtual bool abort(const std::string& reason) = 0;

    State getState() const;
    bool isTerminal() const;
    bool isAborted() const { return getState() == State::Aborted; }
    bool isFinished() const { return getState() == State::Finished; }

    std::string getId() const;
    std::string getLastError() const;
    std::chrono::system_clock::time_point getCreatedAt() const { return createdAt_; }

    static bool isValidTransition(State from, State to);

protected:
    // Returns false, leaving the state untouched, when the move is not allowed.
    bool transitionTo(State next);
    void setError(const std::string& error);
    void setId(const std::string& id);
    std::string generateId() const;

    mutable std::mutex mutex_;

private:
    std::string id_;
    State state_{State::Created};
    std::string error_;
    std::chrono::system_clock::time_point createdAt_;
};
