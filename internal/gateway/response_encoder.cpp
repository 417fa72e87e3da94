#include "internal/gateway/response_encoder.hpp"

#include "internal/protocol/json_codec.hpp"
#include "internal/protocol/xml_writer.hpp"

namespace vera::gateway {

namespace {

constexpr const char* kXmlContentType  = "text/xml;charset=UTF-8";
constexpr const char* kJsonContentType = "application/x-amz-json-1.1";

protocol::XmlNaming NamingFor(const ServiceDefinition& service) {
  protocol::XmlNaming naming;
  naming.names = &service.element_names;
  if (service.protocol == Protocol::kEc2) {
    naming.lower_camel = true;
    naming.list_suffix = "Set";
    naming.item_tag    = "item";
  }
  return naming;
}

std::string NamespaceAttribute(const ServiceDefinition& service) {
  if (service.xml_namespace.empty()) return {};
  return "xmlns=\"" + protocol::EscapeXml(service.xml_namespace) + "\"";
}

} // namespace

EncodedBody EncodeSuccess(const ServiceDefinition& service, const std::string& action, const std::string& request_id, const model::Value& body) {
  if (service.protocol == Protocol::kJson) {
    return {kJsonContentType, protocol::ToJson(body.IsMap() ? body : model::Value::Map())};
  }

  const auto          naming   = NamingFor(service);
  const auto          envelope = action + "Response";
  protocol::XmlWriter xml;
  xml.Declaration();
  xml.Open(envelope, NamespaceAttribute(service));

  if (service.protocol == Protocol::kEc2) {
    xml.Element("requestId", request_id);
    xml.Members(body, naming);
  } else {
    const auto result = action + "Result";
    xml.Open(result);
    xml.Members(body, naming);
    xml.Close(result);
    xml.Open("ResponseMetadata");
    xml.Element("RequestId", request_id);
    xml.Close("ResponseMetadata");
  }

  xml.Close(envelope);
  return {kXmlContentType, xml.Release()};
}

EncodedBody EncodeError(const ServiceDefinition& service, const ApiError& error, const std::string& request_id) {
  switch (service.protocol) {
    case Protocol::kJson: {
      auto doc = model::Value::Map({{"__type", error.code}, {"message", error.message}});
      return {kJsonContentType, protocol::ToJson(doc)};
    }
    case Protocol::kQuery: {
      protocol::XmlWriter xml;
      xml.Declaration();
      xml.Open("ErrorResponse", NamespaceAttribute(service));
      xml.Open("Error");
      xml.Element("Type", error.sender ? "Sender" : "Receiver");
      xml.Element("Code", error.code);
      xml.Element("Message", error.message);
      xml.Close("Error");
      xml.Element("RequestId", request_id);
      xml.Close("ErrorResponse");
      return {kXmlContentType, xml.Release()};
    }
    case Protocol::kEc2:
      break;
  }

  protocol::XmlWriter xml;
  xml.Declaration();
  xml.Open("Response");
  xml.Open("Errors");
  xml.Open("Error");
  xml.Element("Code", error.code);
  xml.Element("Message", error.message);
  xml.Close("Error");
  xml.Close("Errors");
  xml.Element("RequestID", request_id);
  xml.Close("Response");
  return {kXmlContentType, xml.Release()};
}

} // namespace vera::gateway
