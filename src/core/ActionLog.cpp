#include "ActionLog.hpp"

#include <utility>
#include "Exception.hpp"

namespace kasino::core
{
    ActionLog::ActionLog(size_t const capacity) :
        capacity_(capacity)
    {
        KSN_ASSERT(capacity_ > 0, "Action log needs room for at least one record");
    }

    auto ActionLog::Append(ActionRecord record) -> ActionRecord const&
    {
        record.sequence = next_sequence_++;
        while (entries_.size() >= capacity_)
        {
            entries_.pop_front();
        }
        entries_.push_back(std::move(record));
        return entries_.back();
    }

    auto ActionLog::Back() const -> ActionRecord const&
    {
        if (entries_.empty()) KSN_THROW(error::Code::State, "Action log is empty");
        return entries_.back();
    }

    auto to_string(Phase const p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Dealing:       return "Dealing";
        case Phase::Playing:       return "Playing";
        case Phase::PlayingSecond: return "PlayingSecond";
        case Phase::Scoring:       return "Scoring";
        case Phase::GameOver:      return "GameOver";
        }
        return "?";
    }

    auto to_string(ActionType const t) -> std::string_view
    {
        switch (t)
        {
        case ActionType::Capture:       return "capture";
        case ActionType::BuildCreate:   return "buildCreate";
        case ActionType::BuildAugment:  return "buildAugment";
        case ActionType::BuildIncrease: return "buildIncrease";
        case ActionType::StealAndBuild: return "stealAndBuild";
        case ActionType::Drift:         return "drift";
        case ActionType::Sweep:         return "sweep";
        }
        return "?";
    }
}
