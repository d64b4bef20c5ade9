#pragma once

#include "storage/storage.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <variant>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace memkv {

// ── Engine messages ───────────────────────────────────────────────────────────

struct SetCommand {
    std::string key;
    std::string value;
};

struct GetCommand {
    std::string key;
};

struct DeleteCommand {
    std::string key;
};

using EngineMessage = std::variant<SetCommand, GetCommand, DeleteCommand>;

// ── StorageEngine ─────────────────────────────────────────────────────────────
//
// Sole owner of the key-value Storage.  Callers never see the map; they hand
// messages to a single processing loop that runs on the engine's strand and
// applies them one at a time, in arrival order, with no priority between
// message kinds.
//
// Handoff is a synchronous rendezvous: set()/get()/del() suspend the calling
// coroutine until the loop has taken the message and fully processed it.  A
// caller that has seen set() or del() complete therefore knows the mutation is
// applied, and anything it sends afterwards is ordered after it.  get() carries
// its reply back on the same single-use completion.
//
// After every delete the loop checks the deletion counter; once it reaches the
// compaction threshold the map is rebuilt into fresh storage and the counter is
// reset.
//
// stop() is the shutdown signal: the loop exits and releases the map.  Any
// request still waiting at the rendezvous, and any request made afterwards,
// completes with std::errc::operation_canceled.
//
// Thread-safety: the public methods may be called from any thread.  All engine
// state except the atomics is touched only on the strand.
class StorageEngine {
public:
    // Deletions between two compactions.
    static constexpr std::size_t kCompactionThreshold = 1024;

    using GetResult = std::tuple<std::error_code, std::optional<std::string>>;

    // Throws std::invalid_argument if `compaction_threshold` is 0.
    explicit StorageEngine(boost::asio::io_context& ioc,
                           std::size_t compaction_threshold = kCompactionThreshold);

    StorageEngine(const StorageEngine&)            = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;
    StorageEngine(StorageEngine&&)                 = delete;
    StorageEngine& operator=(StorageEngine&&)      = delete;

    ~StorageEngine() = default;

    // ── Lifecycle ─────────────────────────────────────────────────────────────

    // Spawn the processing loop.  Must be called once before any request.
    void start();

    // Deliver the shutdown signal.  Safe to call from any thread, and more than
    // once.
    void stop();

    // ── Requests ──────────────────────────────────────────────────────────────

    // Insert or overwrite `key`.  Completes once the write is applied.
    [[nodiscard]] boost::asio::awaitable<std::error_code>
    set(std::string key, std::string value);

    // Look up `key`.  The optional is empty when the key is absent.
    [[nodiscard]] boost::asio::awaitable<GetResult> get(std::string key);

    // Remove `key` if present.  Counts towards compaction either way.
    [[nodiscard]] boost::asio::awaitable<std::error_code> del(std::string key);

    // ── Accessors ─────────────────────────────────────────────────────────────

    [[nodiscard]] bool stopped() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    // Number of compactions run so far.
    [[nodiscard]] std::uint64_t compactions() const noexcept {
        return compactions_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t compaction_threshold() const noexcept {
        return compaction_threshold_;
    }

private:
    struct Reply {
        std::error_code            ec;
        std::optional<std::string> value;
    };

    // A sender parked at the rendezvous.  `reply` and `done` live in the
    // sender's coroutine frame, which stays suspended until `done` fires.
    struct Envelope {
        EngineMessage               message;
        Reply*                      reply;
        boost::asio::steady_timer*  done;
    };

    // Hop onto the strand, park at the rendezvous, return the reply.
    [[nodiscard]] boost::asio::awaitable<Reply> handoff(EngineMessage message);

    // Runs on the strand (co_spawned by handoff).
    [[nodiscard]] boost::asio::awaitable<Reply> deliver(EngineMessage message);

    // The processing loop.
    boost::asio::awaitable<void> serve();

    // Apply one message to storage_.  Runs on the strand.
    void process(Envelope& envelope);

    // Complete every parked sender with operation_canceled.
    void fail_pending();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer wake_;

    // Senders waiting for the loop to take their message.  Each connection has
    // at most one entry, since a sender stays parked until it is processed.
    std::deque<Envelope> waiting_;

    Storage     storage_;
    std::size_t compaction_threshold_;
    std::size_t deletions_ = 0;
    bool        serving_   = false;

    std::atomic<bool>          stopped_{false};
    std::atomic<std::uint64_t> compactions_{0};
};

} // namespace memkv
