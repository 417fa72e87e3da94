#include "internal/gateway/gateway.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"

namespace {

using vera::gateway::ApiRequest;
using vera::gateway::ApiResponse;
using vera::gateway::ParseCredentialScope;

constexpr const char* kStsAuthorization =
    "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20240101/us-east-1/sts/aws4_request, SignedHeaders=host, Signature=abc";

vera::factory::Application BuildApp(bool sparse = false) {
  auto config = vera::config::ConfigLoader::Defaults();
  if (sparse) config.mutable_emulator()->add_allow_sparse_lists("ec2");
  return vera::factory::Build(config);
}

ApiRequest Form(const std::string& body) {
  ApiRequest request;
  request.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  request.body = body;
  return request;
}

// Text of the first <tag>...</tag> element, empty when absent.
std::string Element(const std::string& xml, const std::string& tag) {
  const auto open  = "<" + tag + ">";
  const auto start = xml.find(open);
  if (start == std::string::npos) return {};
  const auto end = xml.find("</" + tag + ">", start);
  return xml.substr(start + open.size(), end - start - open.size());
}

std::string RequestIdHeader(const ApiResponse& response) {
  for (const auto& [key, value] : response.headers) {
    if (key == "x-amzn-RequestId") return value;
  }
  return {};
}

void TestHealth() {
  auto       app = BuildApp();
  ApiRequest request;
  request.method = "GET";
  request.target = "/health";

  const auto response = app.gateway->Handle(request);
  assert(response.status == 200);
  assert(response.body.find("running") != std::string::npos);
  assert(app.gateway->requests_served() == 0);
}

void TestCreateVpcEnvelope() {
  auto       app      = BuildApp();
  const auto response = app.gateway->Handle(Form("Action=CreateVpc&Version=2016-11-15&CidrBlock=10.0.0.0%2F16"));

  assert(response.status == 200);
  assert(response.content_type.starts_with("text/xml"));
  assert(response.body.find("<CreateVpcResponse xmlns=\"http://ec2.amazonaws.com/doc/2016-11-15/\">") != std::string::npos);
  assert(Element(response.body, "requestId") == RequestIdHeader(response));
  assert(Element(response.body, "vpcId").starts_with("vpc-"));
  assert(Element(response.body, "cidrBlock") == "10.0.0.0/16");
  assert(response.body.find("<state>available</state>") != std::string::npos);
  assert(app.gateway->requests_served() == 1);
  assert(app.gateway->requests_failed() == 0);
}

void TestActionInQueryString() {
  auto       app = BuildApp();
  ApiRequest request;
  request.method = "GET";
  request.target = "/?Action=DescribeVpcs&Version=2016-11-15";

  const auto response = app.gateway->Handle(request);
  assert(response.status == 200);
  assert(response.body.find("<vpcSet></vpcSet>") != std::string::npos);
}

void TestErrorEnvelopes() {
  auto app = BuildApp();

  auto missing = app.gateway->Handle(Form("CidrBlock=10.0.0.0%2F16"));
  assert(missing.status == 400);
  assert(Element(missing.body, "Code") == "MissingAction");
  assert(missing.body.find("<Response><Errors><Error>") != std::string::npos);
  assert(Element(missing.body, "RequestID") == RequestIdHeader(missing));

  auto unknown = app.gateway->Handle(Form("Action=LaunchRockets"));
  assert(unknown.status == 400);
  assert(Element(unknown.body, "Code") == "InvalidAction");

  auto not_found = app.gateway->Handle(Form("Action=DeleteVpc&VpcId=vpc-12345678"));
  assert(not_found.status == 400);
  assert(Element(not_found.body, "Code") == "InvalidVpcID.NotFound");

  auto missing_param = app.gateway->Handle(Form("Action=CreateVpc"));
  assert(missing_param.status == 400);
  assert(Element(missing_param.body, "Code") == "MissingParameter");

  assert(app.gateway->requests_failed() == 4);
}

void TestSparseListsFollowConfiguration() {
  const std::string body = "Action=DescribeVpcs&Filter.1.Name=vpc-id&Filter.1.Value.1=vpc-a&Filter.1.Value.3=vpc-b";

  auto strict   = BuildApp();
  auto rejected = strict.gateway->Handle(Form(body));
  assert(rejected.status == 400);
  assert(Element(rejected.body, "Code") == "MalformedQueryString");

  auto lenient  = BuildApp(true);
  auto accepted = lenient.gateway->Handle(Form(body));
  assert(accepted.status == 200);
}

void TestCredentialScopeSelectsServiceAndRegion() {
  auto app = BuildApp();

  auto request = Form("Action=GetCallerIdentity&Version=2011-06-15");
  request.headers.emplace_back("Authorization", kStsAuthorization);
  const auto identity = app.gateway->Handle(request);
  assert(identity.status == 200);
  assert(identity.body.find("<GetCallerIdentityResult>") != std::string::npos);
  assert(Element(identity.body, "Account") == "000000000000");
  assert(Element(identity.body, "Arn") == "arn:aws:iam::000000000000:root");
  assert(Element(identity.body, "RequestId") == RequestIdHeader(identity));

  auto zones = Form("Action=DescribeAvailabilityZones");
  zones.headers.emplace_back("authorization", "AWS4-HMAC-SHA256 Credential=AKID/20240101/eu-west-1/ec2/aws4_request");
  const auto response = app.gateway->Handle(zones);
  assert(response.status == 200);
  assert(response.body.find("eu-west-1a") != std::string::npos);
  assert(response.body.find("us-east-1a") == std::string::npos);
}

void TestQueryProtocolErrorEnvelope() {
  auto app     = BuildApp();
  auto request = Form("Action=AssumeRole");
  request.headers.emplace_back("Authorization", kStsAuthorization);

  const auto response = app.gateway->Handle(request);
  assert(response.status == 400);
  assert(response.body.find("<ErrorResponse") != std::string::npos);
  assert(Element(response.body, "Type") == "Sender");
  assert(Element(response.body, "Code") == "InvalidAction");
}

void TestUnknownTargetPrefix() {
  auto       app = BuildApp();
  ApiRequest request;
  request.headers.emplace_back("X-Amz-Target", "DynamoDB_20120810.ListTables");
  request.body = "{}";

  const auto response = app.gateway->Handle(request);
  assert(response.status == 400);
  assert(Element(response.body, "Code") == "InvalidAction");
}

void TestParseCredentialScope() {
  const auto scope = ParseCredentialScope(kStsAuthorization);
  assert(scope.has_value());
  assert(scope->region == "us-east-1");
  assert(scope->service == "sts");

  assert(!ParseCredentialScope("Bearer token").has_value());
  assert(!ParseCredentialScope("AWS4-HMAC-SHA256 Credential=AKID/20240101/us-east-1").has_value());
}

} // namespace

int main() {
  TestHealth();
  TestCreateVpcEnvelope();
  TestActionInQueryString();
  TestErrorEnvelopes();
  TestSparseListsFollowConfiguration();
  TestCredentialScopeSelectsServiceAndRegion();
  TestQueryProtocolErrorEnvelope();
  TestUnknownTargetPrefix();
  TestParseCredentialScope();

  std::cout << "vera_unit_gateway: pass\n";
  return 0;
}
