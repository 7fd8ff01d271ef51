#include "core/sequence_matcher.h"

#include <utility>

namespace keychord
{
SequenceMatcher::SequenceMatcher(std::shared_ptr<const BindingTable> table, std::chrono::milliseconds timeout)
    : table_(std::move(table))
    , timeout_(timeout)
{
}

void SequenceMatcher::Reset()
{
    buffer_.clear();
    started_at_ = Clock::time_point{};
    held_.reset();
}

void SequenceMatcher::SetTable(std::shared_ptr<const BindingTable> table)
{
    table_ = std::move(table);
    Reset();
}

MatchOutcome SequenceMatcher::Evaluate(std::optional<Resolution>& deferred) const
{
    MatchOutcome out;
    deferred.reset();

    std::optional<Resolution> complete = table_->LookupSequence(buffer_);
    if (complete.has_value())
    {
        if (complete->exact || !table_->IsLiteralPrefix(buffer_))
        {
            out.status = MatchOutcome::Status::Matched;
            out.resolution = std::move(*complete);
            return out;
        }
        // Group match shadowed by a longer literal; IsPrefix holds.
        deferred = std::move(complete);
    }

    if (table_->IsPrefix(buffer_))
        out.status = MatchOutcome::Status::Pending;
    return out;
}

MatchOutcome SequenceMatcher::Feed(const KeySpec& key, Clock::time_point now)
{
    if (!table_)
        return MatchOutcome{};

    const KeySpec k = Normalize(key);

    std::optional<Resolution> flushed;
    if (!buffer_.empty() && now - started_at_ > timeout_)
    {
        flushed = std::move(held_);
        Reset();
    }

    const bool fresh = buffer_.empty();
    if (fresh)
        started_at_ = now;
    buffer_.push_back(k);

    std::optional<Resolution> deferred;
    MatchOutcome out = Evaluate(deferred);
    if (out.status == MatchOutcome::Status::NoMatch && !fresh)
    {
        // The pending sequence is dead; give the new key its own chance.
        flushed = std::move(held_);
        held_.reset();
        buffer_.clear();
        buffer_.push_back(k);
        started_at_ = now;
        out = Evaluate(deferred);
    }

    if (out.status != MatchOutcome::Status::Pending)
        Reset();
    else if (deferred.has_value())
        held_ = std::move(deferred);

    out.flushed = std::move(flushed);
    return out;
}

} // namespace keychord
