#pragma once
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace sprout::core {

    // Accepts units of work and arranges for their eventual execution.
    //
    // An automaton hands every deferred piece of work to its executor: the
    // initial entry action and one dispatch per posted event. The automaton
    // expects the executor to run those units one at a time, in submission
    // order. Executors that run units concurrently or reorder them break that
    // contract and dispatch will report a DispatchError.
    class Executor {
      public:
        using Task = std::function<void()>;
        using ErrorHandler = std::function<void(std::exception_ptr)>;

        virtual ~Executor() = default;

        virtual void execute(Task task) = 0;

        // Receives failures of submitted work. Install before submitting work.
        void setErrorHandler(ErrorHandler handler) { errorHandler_ = std::move(handler); }
        bool hasErrorHandler() const { return static_cast<bool>(errorHandler_); }

      protected:
        ErrorHandler errorHandler_;
    };

    using ExecutorPtr = std::shared_ptr<Executor>;

    // Runs each task on the calling thread before execute() returns. Failures
    // go to the error handler if one is set, otherwise they reach the caller.
    class InlineExecutor : public Executor {
      public:
        void execute(Task task) override;
    };

    // Single worker thread draining a FIFO mailbox, so submitted work runs one
    // unit at a time in submission order.
    class SerialExecutor : public Executor {
      public:
        struct Options {
            size_t capacity = 0; // 0 = unbounded
            std::string name = "serial";
        };

        SerialExecutor();
        explicit SerialExecutor(Options options);

        // Runs the remaining tasks, then joins the worker. When the last
        // reference is dropped by a task on the worker itself, the worker is
        // detached after that task instead and queued tasks are dropped.
        ~SerialExecutor() override;

        SerialExecutor(const SerialExecutor &) = delete;
        SerialExecutor &operator=(const SerialExecutor &) = delete;

        // Throws ExecutorRejected when bounded and full, or when shutting down
        void execute(Task task) override;

        // Blocks until every task submitted so far has finished
        void drain();

        size_t pending() const;
        const Options &options() const { return options_; }

      private:
        void run();
        void fail(std::exception_ptr error);

        Options options_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::condition_variable idle_;
        std::queue<Task> q_;
        bool busy_ = false;
        bool stop_ = false;
        bool *released_ = nullptr; // lives on the worker's stack
        std::thread worker_;
    };

} // namespace sprout::core
