#ifndef HTTPRANGE_ASIO_IO_WORKER_HPP
#define HTTPRANGE_ASIO_IO_WORKER_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

namespace httprange::asio {

    /// A single thread running its own io_context. Used by the HTTP transport
    /// for socket I/O and by the prefetch scheduler as its background slot.
    class io_worker {
    public:
        explicit io_worker(std::string name);
        ~io_worker();

        io_worker(const io_worker&) = delete;
        io_worker& operator=(const io_worker&) = delete;

        /// start the worker thread (no-op if already running)
        void start();

        /// release the work guard, stop the io_context and join the thread
        void stop();

        bool running() const { return running_; }

        boost::asio::io_context& get_io_context();

        const std::string& name() const { return name_; }

    private:
        void run();

        using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        std::string name_;
        boost::asio::io_context io_;
        std::unique_ptr<work_guard_type> work_;
        std::thread thread_;
        std::mutex mutex_;
        std::atomic<bool> running_{false};
    };

}

#endif
