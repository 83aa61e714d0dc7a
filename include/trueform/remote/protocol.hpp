#pragma once

#include <trueform/common.hpp>

#include <optional>
#include <string>

namespace trueform {
    namespace remote {

        /// JSON-RPC envelope version tag carried by every frame
        constexpr const char *JSONRPC_VERSION = "2.0";

        /// Outgoing call envelope
        /// Wire format: {"jsonrpc":"2.0","method":"pool.query","params":[...],"id":7}
        /// params is omitted from the frame when null
        struct WireRequest {
            std::string jsonrpc;
            std::string method;
            Json params;
            dp::i64 id;
        };

        /// Error object of a failed call
        /// data is opaque and kept as-is (null when absent)
        struct WireError {
            dp::i32 code;
            std::string message;
            Json data;
        };

        /// Incoming reply envelope, carrying either result or error
        struct WireResponse {
            std::string jsonrpc;
            Json result;
            std::optional<WireError> error;
            dp::i64 id;
        };

        inline WireRequest make_request(dp::i64 id, const std::string &method, const Json &params = Json()) {
            return WireRequest{JSONRPC_VERSION, method, params, id};
        }

        inline WireResponse make_result(dp::i64 id, const Json &result) {
            return WireResponse{JSONRPC_VERSION, result, std::nullopt, id};
        }

        inline WireResponse make_error(dp::i64 id, dp::i32 code, const std::string &message, const Json &data = Json()) {
            return WireResponse{JSONRPC_VERSION, Json(), WireError{code, message, data}, id};
        }

        // ========================================================================
        // Encoding
        // ========================================================================

        inline Json request_to_json(const WireRequest &request) {
            Json doc = Json::object();
            doc["jsonrpc"] = request.jsonrpc;
            doc["method"] = request.method;
            if (!request.params.is_null()) {
                doc["params"] = request.params;
            }
            doc["id"] = request.id;
            return doc;
        }

        inline Json response_to_json(const WireResponse &response) {
            Json doc = Json::object();
            doc["jsonrpc"] = response.jsonrpc;
            doc["id"] = response.id;
            if (response.error) {
                Json err = Json::object();
                err["code"] = response.error->code;
                err["message"] = response.error->message;
                if (!response.error->data.is_null()) {
                    err["data"] = response.error->data;
                }
                doc["error"] = err;
            } else {
                doc["result"] = response.result;
            }
            return doc;
        }

        inline Message encode_request(const WireRequest &request) { return to_message(request_to_json(request).dump()); }

        inline Message encode_response(const WireResponse &response) {
            return to_message(response_to_json(response).dump());
        }

        // ========================================================================
        // Decoding
        // ========================================================================

        namespace detail {
            inline dp::Res<Json> parse_object(const Message &frame) {
                Json doc = Json::parse(frame.data(), frame.data() + frame.size(), nullptr, false);
                if (doc.is_discarded()) {
                    echo::trace("frame is not valid JSON (", frame.size(), " bytes)");
                    return dp::result::err(dp::Error::invalid_argument("frame is not valid JSON"));
                }
                if (!doc.is_object()) {
                    return dp::result::err(dp::Error::invalid_argument("frame is not a JSON object"));
                }
                return dp::result::ok(std::move(doc));
            }

            inline bool read_id(const Json &doc, dp::i64 &out) {
                auto it = doc.find("id");
                if (it == doc.end() || !it->is_number_integer()) {
                    return false;
                }
                out = it->get<dp::i64>();
                return true;
            }
        } // namespace detail

        inline dp::Res<WireRequest> decode_request(const Message &frame) {
            auto parse_res = detail::parse_object(frame);
            if (parse_res.is_err()) {
                return dp::result::err(parse_res.error());
            }
            const Json &doc = parse_res.value();

            auto method = doc.find("method");
            if (method == doc.end() || !method->is_string()) {
                return dp::result::err(dp::Error::invalid_argument("request has no method"));
            }

            WireRequest request;
            request.jsonrpc = doc.value("jsonrpc", "");
            request.method = method->get<std::string>();
            request.params = doc.contains("params") ? doc["params"] : Json();
            if (!detail::read_id(doc, request.id)) {
                return dp::result::err(dp::Error::invalid_argument("request has no integer id"));
            }
            return dp::result::ok(std::move(request));
        }

        inline dp::Res<WireResponse> decode_response(const Message &frame) {
            auto parse_res = detail::parse_object(frame);
            if (parse_res.is_err()) {
                return dp::result::err(parse_res.error());
            }
            const Json &doc = parse_res.value();

            WireResponse response;
            response.jsonrpc = doc.value("jsonrpc", "");
            if (!detail::read_id(doc, response.id)) {
                return dp::result::err(dp::Error::invalid_argument("response has no integer id"));
            }

            auto err = doc.find("error");
            if (err != doc.end() && !err->is_null()) {
                if (!err->is_object()) {
                    return dp::result::err(dp::Error::invalid_argument("response error is not an object"));
                }
                auto code = err->find("code");
                if (code == err->end() || !code->is_number_integer()) {
                    return dp::result::err(dp::Error::invalid_argument("response error has no integer code"));
                }
                WireError wire;
                wire.code = code->get<dp::i32>();
                auto message = err->find("message");
                wire.message = (message != err->end() && message->is_string()) ? message->get<std::string>() : "";
                wire.data = err->contains("data") ? (*err)["data"] : Json();
                response.error = std::move(wire);
                return dp::result::ok(std::move(response));
            }

            // A missing result is a null result
            response.result = doc.contains("result") ? doc["result"] : Json();
            return dp::result::ok(std::move(response));
        }

    } // namespace remote
} // namespace trueform
