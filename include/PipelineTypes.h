#pragma once

#include "CanvassExceptions.h"
#include "InsightTypes.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class StageErrorKind { InsufficientData, Vectorization, Training, Persistence, Source };

std::string stageErrorKindToString(StageErrorKind kind);

struct StageError {
    std::string stage;
    StageErrorKind kind = StageErrorKind::Training;
    std::string category;
    std::optional<Polarity> polarity;
    std::string message;

    std::string describe() const;
};

/**
 * Outcome of one pipeline stage: either its output or the error that
 * replaced it. Stages never let exceptions cross into the orchestrator.
 */
template <typename T>
class StageResult {
public:
    static StageResult success(T value) { return StageResult(std::move(value)); }
    static StageResult failure(StageError error) { return StageResult(std::move(error)); }

    bool ok() const noexcept { return std::holds_alternative<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }
    const StageError& error() const { return std::get<StageError>(state_); }

private:
    explicit StageResult(T value) : state_(std::move(value)) {}
    explicit StageResult(StageError error) : state_(std::move(error)) {}

    std::variant<T, StageError> state_;
};

/**
 * @brief Runs `fn` and maps the Canvass exception taxonomy onto a StageResult.
 * @post Never throws for CanvassException or std::exception raised by `fn`.
 */
template <typename Fn>
auto runStage(const std::string& stage,
              const std::string& category,
              std::optional<Polarity> polarity,
              Fn&& fn) -> StageResult<decltype(fn())> {
    using Result = StageResult<decltype(fn())>;
    auto fail = [&](StageErrorKind kind, const std::exception& ex) {
        return Result::failure(StageError{stage, kind, category, polarity, ex.what()});
    };
    try {
        return Result::success(fn());
    } catch (const Canvass::InsufficientDataException& ex) {
        return fail(StageErrorKind::InsufficientData, ex);
    } catch (const Canvass::VectorizationException& ex) {
        return fail(StageErrorKind::Vectorization, ex);
    } catch (const Canvass::PersistenceException& ex) {
        return fail(StageErrorKind::Persistence, ex);
    } catch (const Canvass::IOException& ex) {
        return fail(StageErrorKind::Source, ex);
    } catch (const std::exception& ex) {
        return fail(StageErrorKind::Training, ex);
    }
}

struct PipelineRunSummary {
    int64_t version = 0; // 0 => nothing committed
    size_t trained = 0;
    size_t skipped = 0;
    size_t sentimentsComputed = 0;
    size_t recordCount = 0;
    bool rankingTrained = false;
    bool correlationsTrained = false;
    bool persisted = false;
    bool failed = false;
    std::vector<StageError> errors;
    int64_t startedAt = 0;
    int64_t durationMs = 0;
};
