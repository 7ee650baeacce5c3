#ifndef KASINO_EXCEPTION_HPP
#define KASINO_EXCEPTION_HPP

#include <expected>
#include <format>
#include <optional>
#include <source_location>
#include <stacktrace>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace kasino::core::error
{
    enum class Code : unsigned
    {
        Rules, // rules engine misuse (not user invalid move)
        State, // state snapshot is inconsistent
        InvalidAction, // caller handed the engine something it cannot resolve
        Assertion // internal assertion failed
    };

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Rules: return "Rules";
        case Code::State: return "State";
        case Code::InvalidAction: return "InvalidAction";
        case Code::Assertion: return "Assertion";
        }
        return "?";
    }

    // Where in the game the failure happened; every field is optional
    struct ErrorContext
    {
        std::optional<PlyrIdxT> seat{};
        std::optional<ActionType> action{};
        std::optional<Phase> phase{};
        std::optional<CardId> card{};
    };

    // Raised for engine misuse only; ordinary illegal moves travel as
    // RuleViolation. Records the throw site and the call stack.
    class EngineError
    {
    public:
        EngineError(std::string err_str,
                    Code code,
                    ErrorContext context = {},
                    std::source_location const& src_loc = std::source_location::current(),
                    std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            code_{code},
            context_{std::move(context)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto context() const noexcept -> ErrorContext const& { return context_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        // One line of game context, empty when nothing was attached
        [[nodiscard]]
        auto context_str() const -> std::string
        {
            std::string s;
            if (context_.seat) s += std::format(" seat=P{}", static_cast<int>(*context_.seat));
            if (context_.action) s += std::format(" action={}", core::to_string(*context_.action));
            if (context_.phase) s += std::format(" phase={}", core::to_string(*context_.phase));
            if (context_.card) s += std::format(" card={}", core::to_string(CardFromId(*context_.card)));
            return s;
        }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("[{}] {}:{} in `{}`: {}\n", to_string(code_), src_loc_.file_name(),
                                        src_loc_.line(), src_loc_.function_name(), err_str_);
            if (std::string const ctx = context_str(); !ctx.empty()) s += std::format(" context:{}\n", ctx);
            for (std::stacktrace_entry const& frame : backtrace_)
            {
                if (frame.source_file().empty()) continue;
                s += std::format("  at {}({}): {}\n", frame.source_file(), frame.source_line(),
                                 frame.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        Code code_;
        ErrorContext context_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };

    struct RulesError : public EngineError
    {
        using EngineError::EngineError;
    };

    struct StateError : public EngineError
    {
        using EngineError::EngineError;
    };

    struct InvalidActionError : public EngineError
    {
        using EngineError::EngineError;
    };

    struct AssertionError : public EngineError
    {
        using EngineError::EngineError;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg, ErrorContext ctx = {},
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c, std::move(ctx), loc);
        case Code::State: throw StateError(std::move(msg), c, std::move(ctx), loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, std::move(ctx), loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, std::move(ctx), loc);
        }
        throw std::runtime_error(msg);
    }

// Optional trailing argument: an error::ErrorContext
#define KSN_THROW(code_enum, msg, ...) ::kasino::core::error::fail((code_enum), (msg) __VA_OPT__(,) __VA_ARGS__)
#define KSN_ASSERT(cond, msg, ...) do { if(!(cond)) ::kasino::core::error::fail(::kasino::core::error::Code::Assertion, (msg) __VA_OPT__(,) __VA_ARGS__); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase_PlayRequired,
        Card_NotInHand,
        Card_NotOnTable,
        Card_NotOnPileTop,
        Card_Duplicate,

        // Capture
        Capture_NothingToCapture,
        Capture_OptionNotAvailable,

        // Build
        Build_StealWithoutHandCard,
        Build_OwnsOtherValue,
        Build_NoCaptureCard,
        Build_ValueOutOfRange,
        Build_Empty,
        Build_CardExceedsValue,
        Build_NoExactPartition,

        // Augment
        Augment_UnknownBuild,
        Augment_NotOwner,
        Augment_SumMismatch,

        // Increase
        Increase_UnknownBuild,
        Increase_OwnBuild,
        Increase_AugmentedBuild,
        Increase_ValueAboveTen,

        // Drift
        Drift_OwnsBuild,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<PlyrIdxT> owner{};

        std::optional<int> value{}; // declared/required build value
        std::optional<int> attempted{}; // e.g. sum or card count the caller offered
        std::optional<BuildId> build{};
        std::optional<CardId> card{};

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_owner(PlyrIdxT s) -> RuleViolation&
        {
            owner = s;
            return *this;
        }

        auto with_value(int v) -> RuleViolation&
        {
            value = v;
            return *this;
        }

        auto with_attempted(int v) -> RuleViolation&
        {
            attempted = v;
            return *this;
        }

        auto with_build(BuildId b) -> RuleViolation&
        {
            build = b;
            return *this;
        }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card = c.id;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongPhase_PlayRequired: return "Wrong phase (hand not in play)";
        case E::Card_NotInHand: return "Card not in the mover's hand";
        case E::Card_NotOnTable: return "Card not loose on the table";
        case E::Card_NotOnPileTop: return "Card is not on top of an opponent's capture pile";
        case E::Card_Duplicate: return "Card referenced twice in one action";

        case E::Capture_NothingToCapture: return "Capture: card captures nothing";
        case E::Capture_OptionNotAvailable: return "Capture: requested combinations are not a legal option";

        case E::Build_StealWithoutHandCard: return "Build: stealing requires playing a hand card";
        case E::Build_OwnsOtherValue: return "Build: mover already owns a build of another value";
        case E::Build_NoCaptureCard: return "Build: no card left in hand to capture the build";
        case E::Build_ValueOutOfRange: return "Build: declared value outside 1..10";
        case E::Build_Empty: return "Build: no cards contributed";
        case E::Build_CardExceedsValue: return "Build: a card exceeds the declared value";
        case E::Build_NoExactPartition: return "Build: cards cannot be grouped into exact sums";

        case E::Augment_UnknownBuild: return "Augment: build not on the table";
        case E::Augment_NotOwner: return "Augment: build owned by another player";
        case E::Augment_SumMismatch: return "Augment: group does not sum to the build value";

        case E::Increase_UnknownBuild: return "Increase: build not on the table";
        case E::Increase_OwnBuild: return "Increase: cannot increase your own build";
        case E::Increase_AugmentedBuild: return "Increase: augmented builds are fixed";
        case E::Increase_ValueAboveTen: return "Increase: new value above 10";

        case E::Drift_OwnsBuild: return "Drift: mover owns a build";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.owner) s += std::format(" | owner=P{}", static_cast<int>(*v.owner));
        if (v.value) s += std::format(" | value={}", *v.value);
        if (v.attempted) s += std::format(" | attempted={}", *v.attempted);
        if (v.build) s += std::format(" | build={:#x}", *v.build);
        if (v.card) s += std::format(" | card={}", to_string(CardFromId(*v.card)));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

template <>
struct std::formatter<kasino::core::error::EngineError> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(kasino::core::error::EngineError const& e, FormatContext& ctx) const
    {
        return std::formatter<std::string_view>::format(e.to_str(), ctx);
    }
};

#endif //KASINO_EXCEPTION_HPP
