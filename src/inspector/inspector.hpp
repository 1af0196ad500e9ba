#pragma once

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "timeframe.hpp"
#include "../stamps/stamps.hpp"

namespace net = boost::asio;

// path -> the stamp that put it there
using Hits = std::map<std::string, Timestamp, std::less<>>;
using Errors = std::map<std::string, boost::system::error_code, std::less<>>;

// Handlers run on pool threads, one call at a time. They must not read
// created()/accessed()/modified()/errors() before inspect() has completed.
using ErrorHandler = std::function<void(const std::string& path, const boost::system::error_code& ec)>;
using MatchHandler = std::function<void(const std::string& path, const Stamps& stamps)>;

// root is missing, not a directory or can't be listed
class ScanInitiationError : public std::runtime_error {
    public:
        ScanInitiationError(std::string path, boost::system::error_code ec)
            : std::runtime_error("cannot scan " + path + ": " + ec.message()),
              path_(std::move(path)), code_(ec) {}

        const std::string& path() const { return path_; }
        const boost::system::error_code& code() const { return code_; }

    private:
        std::string path_;
        boost::system::error_code code_;
};

// Walks a tree once and sorts every regular file into created/accessed/modified
// depending on which of its stamps land inside the time frame.
class Inspector {
    public:
        Inspector(std::string root,
                  TimeFrame frame,
                  ErrorHandler report_errors = nullptr,
                  MatchHandler report_matches = nullptr)
            : root_(std::move(root)),
              frame_(frame),
              report_errors_(std::move(report_errors)),
              report_matches_(std::move(report_matches)) {}

        Inspector(std::string root,
                  Timestamp end,
                  Window window,
                  ErrorHandler report_errors = nullptr)
            : Inspector(std::move(root), TimeFrame::from_end(end, window), std::move(report_errors)) {}

        Inspector(const Inspector&) = delete;
        Inspector& operator=(const Inspector&) = delete;

        // Single shot. Throws ScanInitiationError if the root can't be walked,
        // std::logic_error if called a second time.
        net::awaitable<void> inspect();

        const std::string& root() const { return root_; }
        const TimeFrame& frame() const { return frame_; }

        // Only meaningful once inspect() has completed.
        const Hits& created() const { return created_; }
        const Hits& accessed() const { return accessed_; }
        const Hits& modified() const { return modified_; }
        const Errors& errors() const { return errors_; }

    private:
        void check_root();
        net::awaitable<void> walk(net::thread_pool& pool);
        net::awaitable<void> check(std::vector<std::string> paths);
        void report_error(const std::string& path, const boost::system::error_code& ec);

        const std::string root_;
        const TimeFrame frame_;
        ErrorHandler report_errors_;
        MatchHandler report_matches_;

        bool started_ = false;

        // guards the four maps below
        std::mutex results_mutex_;
        Hits created_;
        Hits accessed_;
        Hits modified_;
        Errors errors_;

        // handlers are called one at a time so callers don't have to lock
        std::mutex handler_mutex_;
};
