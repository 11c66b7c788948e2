// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include <boost/asio/execution_context.hpp>

namespace ethrpc {

//! Owns one collaborator instance per execution context so that API classes can look it up by type
template <typename T>
class PrivateService : public boost::asio::detail::execution_context_service_base<PrivateService<T>> {
  public:
    explicit PrivateService(boost::asio::execution_context& owner)
        : boost::asio::detail::execution_context_service_base<PrivateService<T>>(owner) {}

    void shutdown() override { unique_.reset(); }

    //! Explicitly *take ownership* of \code std::unique_ptr to enforce isolation
    void set_unique(std::unique_ptr<T> unique) {
        unique_ = std::move(unique);
    }
    T* ptr() { return unique_.get(); }

  private:
    std::unique_ptr<T> unique_;
};

template <typename T>
void add_private_service(boost::asio::execution_context& context, std::unique_ptr<T> unique) {
    if (!boost::asio::has_service<PrivateService<T>>(context)) {
        boost::asio::make_service<PrivateService<T>>(context);
    }
    boost::asio::use_service<PrivateService<T>>(context).set_unique(std::move(unique));
}

template <typename T>
T* use_private_service(boost::asio::execution_context& context) {
    if (!boost::asio::has_service<PrivateService<T>>(context)) {
        return nullptr;
    }
    return boost::asio::use_service<PrivateService<T>>(context).ptr();
}

template <typename T>
T* must_use_private_service(boost::asio::execution_context& context) {
    T* service = use_private_service<T>(context);
    if (!service) {
        throw std::logic_error{"unregistered private service: " + std::string{typeid(T).name()}};
    }
    return service;
}

}  // namespace ethrpc
