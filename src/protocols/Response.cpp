/* @file Response.cpp
 * @brief envelope encode / decode
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// cuebridge headers
#include "protocols/Response.hpp"

namespace cuebridge {
  namespace protocols {

    std::optional<ErrorKind> errorKindFromString(std::string_view text) {
      for (auto kind : { ErrorKind::ParseError, ErrorKind::UnknownCommand,
                         ErrorKind::TransportNotAllowed, ErrorKind::HostError,
                         ErrorKind::TimeoutError, ErrorKind::Shutdown }) {
        if (toString(kind) == text)
          return kind;
      }
      return std::nullopt;
    }

    Response Response::success(nlohmann::json result) {
      Response response;
      response.status = Status::Success;
      response.result = result.is_null() ? nlohmann::json::object() : std::move(result);
      return response;
    }

    Response Response::failure(ErrorKind kind, std::string message) {
      Response response;
      response.status = Status::Error;
      response.message = std::move(message);
      response.errorKind = kind;
      return response;
    }

    std::string Response::toWire() const {
      nlohmann::json doc;
      if (ok()) {
        doc["status"] = "success";
        doc["result"] = result;
      } else {
        doc["status"] = "error";
        doc["message"] = message;
        if (errorKind)
          doc["error_kind"] = std::string(toString(*errorKind));
      }
      // replace invalid UTF-8 from host strings instead of throwing mid-write
      return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    }

    std::optional<Response> Response::fromWire(const std::string& text) {
      auto doc = nlohmann::json::parse(text, nullptr, false);
      if (doc.is_discarded() || !doc.is_object())
        return std::nullopt;

      auto statusIt = doc.find("status");
      if (statusIt == doc.end() || !statusIt->is_string())
        return std::nullopt;

      const auto status = statusIt->get<std::string>();
      if (status == "success") {
        auto resultIt = doc.find("result");
        return success(resultIt == doc.end() ? nlohmann::json::object() : *resultIt);
      }
      if (status != "error")
        return std::nullopt;

      Response response;
      response.status = Status::Error;
      response.message = doc.value("message", std::string{});
      if (auto kindIt = doc.find("error_kind"); kindIt != doc.end() && kindIt->is_string())
        response.errorKind = errorKindFromString(kindIt->get<std::string>());
      return response;
    }

  } // namespace protocols
} // namespace cuebridge
