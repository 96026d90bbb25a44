#include "sprout/core/executor.hpp"
#include "sprout/core/error.hpp"
#include "sprout/core/log.hpp"
#include <stdexcept>

namespace sprout::core {

    namespace {
        std::string describe(std::exception_ptr error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception &e) {
                return e.what();
            } catch (...) {
                return "non-standard exception";
            }
        }
    } // namespace

    void InlineExecutor::execute(Task task) {
        if (!errorHandler_) {
            task();
            return;
        }
        try {
            task();
        } catch (...) {
            errorHandler_(std::current_exception());
        }
    }

    SerialExecutor::SerialExecutor() : SerialExecutor(Options{}) {}

    SerialExecutor::SerialExecutor(Options options) : options_(std::move(options)) {
        worker_ = std::thread([this] { run(); });
    }

    SerialExecutor::~SerialExecutor() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
            if (std::this_thread::get_id() == worker_.get_id()) {
                // Last reference dropped by one of our own tasks: the worker
                // cannot join itself, so it is told to stop touching this object.
                if (!q_.empty()) {
                    logger()->warn("Executor '{}' released from its own worker, dropping {} pending task(s)",
                                   options_.name, q_.size());
                }
                *released_ = true;
                worker_.detach();
                return;
            }
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void SerialExecutor::execute(Task task) {
        if (!task) {
            throw std::invalid_argument("Task must not be empty!");
        }
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) {
                throw ExecutorRejected("Executor '" + options_.name + "' is shutting down");
            }
            if (options_.capacity > 0 && q_.size() >= options_.capacity) {
                throw ExecutorRejected("Executor '" + options_.name + "' is full (capacity " +
                                       std::to_string(options_.capacity) + ")");
            }
            q_.push(std::move(task));
        }
        cv_.notify_one();
    }

    void SerialExecutor::drain() {
        if (std::this_thread::get_id() == worker_.get_id()) {
            throw std::logic_error("drain() called from the executor's own worker");
        }
        std::unique_lock<std::mutex> lk(m_);
        idle_.wait(lk, [&] { return q_.empty() && !busy_; });
    }

    size_t SerialExecutor::pending() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    void SerialExecutor::run() {
        bool released = false;
        {
            std::lock_guard<std::mutex> lk(m_);
            released_ = &released;
        }
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
                if (stop_ && q_.empty()) {
                    idle_.notify_all();
                    return;
                }
                task = std::move(q_.front());
                q_.pop();
                busy_ = true;
            }
            std::exception_ptr error;
            try {
                task();
            } catch (...) {
                error = std::current_exception();
            }
            if (released) {
                if (error) {
                    logger()->error("Task failed after its executor was released: {}", describe(error));
                }
                return;
            }
            if (error) {
                fail(error);
            }
            {
                std::lock_guard<std::mutex> lk(m_);
                busy_ = false;
            }
            idle_.notify_all();
        }
    }

    void SerialExecutor::fail(std::exception_ptr error) {
        if (errorHandler_) {
            errorHandler_(error);
            return;
        }
        logger()->error("Executor '{}': task failed: {}", options_.name, describe(error));
    }

} // namespace sprout::core
