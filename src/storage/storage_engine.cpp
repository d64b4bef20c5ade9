#include "storage/storage_engine.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace memkv {

using boost::asio::awaitable;
using boost::asio::steady_timer;

namespace {
constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);
} // namespace

StorageEngine::StorageEngine(boost::asio::io_context& ioc,
                             std::size_t compaction_threshold)
    : strand_(boost::asio::make_strand(ioc)),
      wake_(strand_),
      compaction_threshold_(compaction_threshold) {
    if (compaction_threshold_ == 0) {
        throw std::invalid_argument("compaction threshold must be > 0");
    }
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

void StorageEngine::start() {
    boost::asio::co_spawn(
        strand_,
        [this]() -> awaitable<void> {
            co_await serve();
        },
        boost::asio::detached);
}

void StorageEngine::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    boost::asio::dispatch(strand_, [this]() {
        if (serving_) {
            wake_.cancel();
        } else {
            fail_pending();
            storage_.clear();
        }
    });

    spdlog::info("StorageEngine: shutdown signalled");
}

// ── Requests ──────────────────────────────────────────────────────────────────

awaitable<std::error_code> StorageEngine::set(std::string key, std::string value) {
    auto reply = co_await handoff(SetCommand{std::move(key), std::move(value)});
    co_return reply.ec;
}

awaitable<StorageEngine::GetResult> StorageEngine::get(std::string key) {
    auto reply = co_await handoff(GetCommand{std::move(key)});
    co_return GetResult{reply.ec, std::move(reply.value)};
}

awaitable<std::error_code> StorageEngine::del(std::string key) {
    auto reply = co_await handoff(DeleteCommand{std::move(key)});
    co_return reply.ec;
}

awaitable<StorageEngine::Reply> StorageEngine::handoff(EngineMessage message) {
    co_return co_await boost::asio::co_spawn(
        strand_, deliver(std::move(message)), boost::asio::use_awaitable);
}

awaitable<StorageEngine::Reply> StorageEngine::deliver(EngineMessage message) {
    Reply reply;

    if (stopped_.load(std::memory_order_acquire)) {
        reply.ec = std::make_error_code(std::errc::operation_canceled);
        co_return reply;
    }

    // `done` is the signal mechanism: the loop cancels it once the message has
    // been processed (or the engine shuts down).
    steady_timer done{strand_, steady_timer::time_point::max()};
    waiting_.push_back(Envelope{std::move(message), &reply, &done});
    wake_.cancel();

    auto [ec] = co_await done.async_wait(use_awaitable);
    (void)ec; // always operation_aborted; the outcome is in `reply`

    co_return reply;
}

// ── Processing loop ───────────────────────────────────────────────────────────

awaitable<void> StorageEngine::serve() {
    serving_ = true;
    spdlog::debug("StorageEngine: processing loop started (compaction every {} deletions)",
                  compaction_threshold_);

    while (!stopped_.load(std::memory_order_acquire)) {
        if (waiting_.empty()) {
            wake_.expires_at(steady_timer::time_point::max());
            auto [ec] = co_await wake_.async_wait(use_awaitable);
            (void)ec;
            continue;
        }

        Envelope envelope = std::move(waiting_.front());
        waiting_.pop_front();

        process(envelope);
        envelope.done->cancel();
    }

    fail_pending();
    storage_.clear();
    serving_ = false;

    spdlog::info("StorageEngine: processing loop stopped, storage released");
}

void StorageEngine::process(Envelope& envelope) {
    std::visit(
        [&](auto& msg) {
            using T = std::decay_t<decltype(msg)>;

            if constexpr (std::is_same_v<T, SetCommand>) {
                storage_.set(std::move(msg.key), std::move(msg.value));

            } else if constexpr (std::is_same_v<T, GetCommand>) {
                envelope.reply->value = storage_.get(msg.key);

            } else if constexpr (std::is_same_v<T, DeleteCommand>) {
                storage_.del(msg.key);
                ++deletions_;

                if (deletions_ >= compaction_threshold_) {
                    storage_.compact();
                    deletions_ = 0;
                    const auto n = compactions_.fetch_add(1, std::memory_order_relaxed) + 1;
                    spdlog::debug("StorageEngine: compaction #{} done, {} live keys",
                                  n, storage_.size());
                }
            }
        },
        envelope.message);
}

void StorageEngine::fail_pending() {
    for (auto& envelope : waiting_) {
        envelope.reply->ec = std::make_error_code(std::errc::operation_canceled);
        envelope.done->cancel();
    }
    if (!waiting_.empty()) {
        spdlog::info("StorageEngine: failed {} pending request(s)", waiting_.size());
    }
    waiting_.clear();
}

} // namespace memkv
