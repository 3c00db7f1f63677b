#pragma once

#include "error.hpp"

#include <utility>
#include <variant>

namespace chew {

/// 処理結果（成功値またはエラー）
template <typename T>
class Result {
   public:
    static Result Success(T value) { return Result(std::move(value)); }
    static Result Failure(Error error) { return Result(std::move(error)); }

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(data_); }
    T& value() & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const Error& error() const { return std::get<Error>(data_); }

   private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(std::move(error)) {}

    std::variant<T, Error> data_;
};

}  // namespace chew
