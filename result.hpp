#pragma once

#include <stdexcept>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

// Placeholder payload for results that carry no value on success.
struct Unit {};

template <typename TOk>
struct Result_ok {
    TOk data;
};

template <typename TError>
struct Result_err {
    TError data;
};

struct ResultInit {
    template<typename TOk>
    static Result_ok<std::decay_t<TOk>> ok(TOk&& data) {
        return Result_ok<std::decay_t<TOk>> { std::forward<TOk>(data) };
    }

    static Result_ok<Unit> ok() {
        return Result_ok<Unit> { Unit {} };
    }

    template<typename TError>
    static Result_err<std::decay_t<TError>> err(TError&& data) {
        return Result_err<std::decay_t<TError>> { std::forward<TError>(data) };
    }
};

template <typename TOk, typename TError>
struct Result {
private:
    bool is_ok;
    std::optional<TOk> ok_data;
    std::optional<TError> error_data;
public:
    Result(Result_ok<TOk>&& data) : is_ok(true), ok_data(std::move(data.data)) {}
    Result(Result_err<TError>&& data) : is_ok(false), error_data(std::move(data.data)) {}

    bool isOk() const {
        return is_ok;
    }

    const TOk& getOkRef() const & {
        if (!is_ok) {
            throw std::logic_error("Result::getOkRef called on errored result");
        }

        return *ok_data;
    }

    const TError& getErrRef() const & {
        if (is_ok) {
            throw std::logic_error("Result::getErrRef called on successful result");
        }

        return *error_data;
    }

    TOk&& getOkRef() && {
        if (!is_ok) {
            throw std::logic_error("Result::getOkRef called on errored result");
        }

        return *std::move(ok_data);
    }

    TError&& getErrRef() && {
        if (is_ok) {
            throw std::logic_error("Result::getErrRef called on successful result");
        }

        return *std::move(error_data);
    }
};

// Outcome of an operation that only reports failure.
using Status = Result<Unit, std::string>;
