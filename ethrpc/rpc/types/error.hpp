// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <ethrpc/core/common/bytes.hpp>

namespace ethrpc::rpc {

struct Error {
    int code{0};
    std::string message;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

struct RevertError : public Error {
    Bytes data;
};

std::ostream& operator<<(std::ostream& out, const RevertError& error);

//! The requested entity does not exist at the resolved point: a normal empty result for optional methods
class NotFoundError : public std::runtime_error {
  public:
    explicit NotFoundError(const std::string& what) : std::runtime_error{what} {}
};

//! Structurally invalid parameter detected before any collaborator is called
class InvalidParamsError : public std::runtime_error {
  public:
    explicit InvalidParamsError(const std::string& what) : std::runtime_error{what} {}
};

//! A well-formed block identifier became unreachable
class ResolutionError : public std::runtime_error {
  public:
    enum class Reason {
        kPrunedOrUnavailable,
        kReorgedDuringCall,
    };

    ResolutionError(Reason reason, const std::string& what) : std::runtime_error{what}, reason_{reason} {}

    Reason reason() const { return reason_; }

  private:
    Reason reason_;
};

std::string_view to_string(ResolutionError::Reason reason);

//! Sandboxed execution could not produce a usable result
class ExecutionError : public std::exception {
  public:
    ExecutionError(int64_t error_code, std::string message)
        : error_code_{error_code}, message_{std::move(message)}, data_{} {}

    ExecutionError(int64_t error_code, std::string message, Bytes data)
        : error_code_{error_code}, message_{std::move(message)}, data_{std::move(data)} {}

    ~ExecutionError() noexcept override = default;

    int64_t error_code() const {
        return error_code_;
    }

    const std::string& message() const {
        return message_;
    }

    const Bytes& data() const {
        return data_;
    }

    const char* what() const noexcept override {
        return message_.c_str();
    }

  private:
    int64_t error_code_;
    std::string message_;
    Bytes data_;
};

}  // namespace ethrpc::rpc
