// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "normalizer.hpp"

#include <string>

#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/protocol/errors.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc::json_rpc {

nlohmann::json make_error_reply(const nlohmann::json& request, const MethodTraits& traits, std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const NotFoundError& e) {
        ETHRPC_DEBUG << traits.name << " not found: " << e.what();
        if (traits.result_kind == ResultKind::kOptional) {
            return make_json_content(request, nlohmann::json(nullptr));
        }
        return make_json_error(request, kResourceNotFound, e.what());
    } catch (const InvalidParamsError& e) {
        ETHRPC_ERROR << "invalid " << traits.name << " params: " << e.what();
        return make_json_error(request, kInvalidParams, e.what());
    } catch (const ResolutionError& e) {
        ETHRPC_ERROR << traits.name << " block resolution failed: " << e.what();
        return make_json_error(request, kResourceUnavailable, std::string{to_string(e.reason())} + ": " + e.what());
    } catch (const ExecutionError& e) {
        ETHRPC_ERROR << traits.name << " execution failed: " << e.what() << " code: " << e.error_code();
        if (e.data().empty()) {
            return make_json_error(request, static_cast<int>(e.error_code()), e.message());
        }
        return make_json_error(request, RevertError{{static_cast<int>(e.error_code()), e.message()}, e.data()});
    } catch (const std::exception& e) {
        ETHRPC_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        return make_json_error(request, kInternalError, e.what());
    }
}

}  // namespace ethrpc::rpc::json_rpc
