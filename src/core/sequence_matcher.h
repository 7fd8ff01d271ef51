#pragma once

#include "core/binding_table.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace keychord
{
using Clock = std::chrono::steady_clock;

struct MatchOutcome
{
    enum class Status : std::uint8_t
    {
        NoMatch = 0, // nothing bound; matcher is idle again
        Pending,     // buffer is a prefix of a longer sequence
        Matched,
    };

    Status     status = Status::NoMatch;
    Resolution resolution; // valid when Matched

    // A group match that was held back for a longer literal sequence which
    // then broke or timed out. Reported alongside this key's own outcome.
    std::optional<Resolution> flushed;

    bool IsMatched() const { return status == Status::Matched; }
    bool IsPending() const { return status == Status::Pending; }
};

// Incremental multi-key matcher.
//
// Driven synchronously: the caller presents (key, now) pairs and the pending
// buffer expires lazily when the next key arrives more than `timeout` after the
// first key of the buffer. No timers, no locking; use one matcher per input
// stream.
//
// A key that breaks a pending sequence is retried on its own in the same call,
// so it can still start (or complete) a binding.
//
// When a group pattern completes on a key that also begins a longer literal
// sequence (e.g. "@any" and "g g" on 'g'), the literal sequence wins and the
// matcher waits for the next key. If that sequence is abandoned, the held
// group match comes back in MatchOutcome::flushed.
class SequenceMatcher
{
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{1000};

    explicit SequenceMatcher(std::shared_ptr<const BindingTable> table,
                             std::chrono::milliseconds timeout = kDefaultTimeout);

    MatchOutcome Feed(const KeySpec& key, Clock::time_point now);

    void Reset();

    // Installs a new table (mode switch or reload) and drops any pending keys.
    void SetTable(std::shared_ptr<const BindingTable> table);
    const std::shared_ptr<const BindingTable>& Table() const { return table_; }

    void SetTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds Timeout() const { return timeout_; }

    bool IsPending() const { return !buffer_.empty(); }
    const Sequence& Buffer() const { return buffer_; }
    Clock::time_point StartedAt() const { return started_at_; }

private:
    MatchOutcome Evaluate(std::optional<Resolution>& deferred) const;

    std::shared_ptr<const BindingTable> table_;
    std::chrono::milliseconds           timeout_;
    Sequence                            buffer_;
    Clock::time_point                   started_at_{};
    std::optional<Resolution>           held_;
};

} // namespace keychord
