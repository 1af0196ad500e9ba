#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/filesystem.hpp>

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

#include "inspector.hpp"

// max files handed to one worker coroutine
#define STAT_BATCH_SIZE 256

namespace fs  = boost::filesystem;
namespace sys = boost::system;

void Inspector::check_root() {
    sys::error_code ec;
    auto st = fs::status(root_, ec);
    if (!fs::exists(st))
        throw ScanInitiationError(root_, ec ? ec : sys::errc::make_error_code(sys::errc::no_such_file_or_directory));
    if (ec)
        throw ScanInitiationError(root_, ec);
    if (!fs::is_directory(st))
        throw ScanInitiationError(root_, sys::errc::make_error_code(sys::errc::not_a_directory));

    // exists and is a dir but we may still not be allowed to list it
    fs::directory_iterator it(root_, ec);
    if (ec)
        throw ScanInitiationError(root_, ec);
}

void Inspector::report_error(const std::string& path, const sys::error_code& ec) {
    {
        std::lock_guard<std::mutex> lk(results_mutex_);
        errors_.emplace(path, ec);
    }
    if (report_errors_) {
        std::lock_guard<std::mutex> lk(handler_mutex_);
        report_errors_(path, ec);
    }
}

net::awaitable<void> Inspector::check(std::vector<std::string> paths) {
    // collect locally, take the lock once per batch
    Hits created, accessed, modified;

    for (const auto& path : paths) {
        sys::error_code ec;
        Stamps stamps = read_stamps(path, ec);
        if (ec) {
            report_error(path, ec);
            continue;
        }

        bool matched = false;
        if (frame_.contains(stamps.birth)) {
            created.emplace(path, stamps.birth);
            matched = true;
        }
        if (frame_.contains(stamps.access)) {
            accessed.emplace(path, stamps.access);
            matched = true;
        }
        if (frame_.contains(stamps.modify)) {
            modified.emplace(path, stamps.modify);
            matched = true;
        }

        if (matched && report_matches_) {
            std::lock_guard<std::mutex> lk(handler_mutex_);
            report_matches_(path, stamps);
        }
    }

    std::lock_guard<std::mutex> lk(results_mutex_);
    created_.merge(created);
    accessed_.merge(accessed);
    modified_.merge(modified);
    co_return;
}

// Runs on a strand of the pool. Lists directories one by one and hands the
// files out in batches. Batch completions come back on the same strand so
// `pending` and friends are only ever touched from here.
net::awaitable<void> Inspector::walk(net::thread_pool& pool) {
    auto strand = co_await net::this_coro::executor;

    std::size_t pending = 0;
    bool walking = true;
    std::exception_ptr failure;
    net::steady_timer all_done(strand, net::steady_timer::time_point::max());

    auto on_batch_done = [&](std::exception_ptr e) {
        if (e && !failure)
            failure = e;
        if (--pending == 0 && !walking)
            all_done.cancel();
    };

    std::vector<std::string> batch;
    auto dispatch = [&]() {
        ++pending;
        net::co_spawn(pool, check(std::exchange(batch, {})), net::bind_executor(strand, on_batch_done));
    };

    try {
        std::vector<fs::path> dirs{fs::path(root_)};

        while (!dirs.empty()) {
            fs::path dir = std::move(dirs.back());
            dirs.pop_back();

            sys::error_code ec;
            fs::directory_iterator it(dir, ec), end;
            if (ec) {
                report_error(dir.string(), ec);
                continue;
            }

            for (; !ec && it != end; it.increment(ec)) {
                const fs::path& p = it->path();

                sys::error_code st_ec;
                fs::file_status st = it->symlink_status(st_ec);
                if (st_ec) {
                    report_error(p.string(), st_ec);
                    continue;
                }

                if (fs::is_directory(st)) {
                    dirs.push_back(p);
                    continue;
                }

                if (fs::is_symlink(st)) {
                    // Links to dirs are not followed. A dangling link or one we
                    // can't resolve still goes to check() so the stat error
                    // gets reported against it there.
                    fs::file_status target = fs::status(p, st_ec);
                    if (fs::is_directory(target) || fs::is_other(target))
                        continue;
                } else if (!fs::is_regular_file(st)) {
                    // fifos, sockets, devices
                    continue;
                }

                batch.push_back(p.string());
                if (batch.size() == STAT_BATCH_SIZE)
                    dispatch();
            }
            if (ec)
                report_error(dir.string(), ec);

            if (!batch.empty())
                dispatch();

            // let finished batches report in before the next listing
            co_await net::post(strand, net::use_awaitable);
        }
    } catch (...) {
        // batches still reference this frame, wait for them before rethrowing
        if (!failure)
            failure = std::current_exception();
    }

    walking = false;
    if (pending > 0) {
        // the last batch cancels the timer, operation_aborted is the wake up
        sys::error_code ec;
        co_await all_done.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    if (failure)
        std::rethrow_exception(failure);
}

net::awaitable<void> Inspector::inspect() {
    if (started_)
        throw std::logic_error("inspect() already ran on this Inspector");
    started_ = true;

    check_root();

    net::thread_pool pool(std::max(1u, std::thread::hardware_concurrency()));
    co_await net::co_spawn(net::make_strand(pool), walk(pool), net::use_awaitable);
    pool.join();
}
