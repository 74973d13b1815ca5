/* @file Request.cpp
 * @brief JSON request decoding with strict shape checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// cuebridge headers
#include "protocols/Request.hpp"
#include "protocols/ProtocolError.hpp"

using namespace cuebridge::protocols;

Request Request::fromWire(std::string_view text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    throw ProtocolError(ErrorKind::ParseError, std::string("Invalid JSON: ") + e.what());
  }

  if (!doc.is_object())
    throw ProtocolError(ErrorKind::ParseError, "Message must be a JSON object");

  auto typeIt = doc.find("type");
  if (typeIt == doc.end() || !typeIt->is_string())
    throw ProtocolError(ErrorKind::ParseError, "Message is missing a string 'type' field");

  Request request;
  request.type = typeIt->get<std::string>();

  auto paramsIt = doc.find("params");
  if (paramsIt != doc.end() && !paramsIt->is_null()) {
    if (!paramsIt->is_object())
      throw ProtocolError(ErrorKind::ParseError, "'params' must be a JSON object");
    request.params = std::move(*paramsIt);
  }
  return request;
}

std::string Request::toWire() const {
  return nlohmann::json{ { "type", type }, { "params", params } }.dump();
}
