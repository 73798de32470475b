#ifndef STAGE_RESULT_HPP
#define STAGE_RESULT_HPP

#include <string>
#include <utility>
#include <variant>

/**
 * @brief Categories of terminal workflow failures.
 *
 * Every stage reports exactly one of these when it cannot complete. None of
 * them is retried.
 */
enum class FailureKind {
    ArgumentError,
    MissingTool,
    InvalidCredential,
    NotAuthenticated,
    MissingArtifact,
    MissingIdentity,
    AlreadyExists,
    RemoteError,
    VcsError,
    PushError
};

/** @return Stable name of @p kind as printed in diagnostics (e.g. "PushError"). */
const char* failure_kind_name(FailureKind kind);

/// Empty success payload for stages that only have side effects.
struct Unit {};

struct Failure {
    FailureKind kind;
    std::string message;
};

/**
 * @brief Format a failure as the single diagnostic line shown to the operator.
 *
 * @return Text of the form `Error [Kind]: message`.
 */
std::string describe(const Failure& failure);

/**
 * @brief Outcome of a workflow stage: either a payload or a Failure.
 *
 * A Failure converts implicitly into a StageResult of any payload type so a
 * caller can hand a failed result up unchanged with `return r.error();`.
 */
template <typename T> class StageResult {
  public:
    static StageResult success(T value) { return StageResult(std::move(value)); }

    static StageResult failure(FailureKind kind, std::string message) {
        return StageResult(Failure{kind, std::move(message)});
    }

    StageResult(Failure failure) : state_(std::move(failure)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }

    const Failure& error() const { return std::get<Failure>(state_); }

  private:
    explicit StageResult(T value) : state_(std::move(value)) {}

    std::variant<T, Failure> state_;
};

#endif // STAGE_RESULT_HPP
