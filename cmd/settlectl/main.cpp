#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "cmd/settlectl/args.hpp"
#include "settle/v1.hpp"

using namespace settle::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  settlectl <addr> ingest <events.json>\n"
            << "  settlectl <addr> policy <use_case>\n"
            << "  settlectl <addr> preview <use_case> <start> <end> [key=value ...]\n"
            << "  settlectl <addr> execute <use_case> <start> <end> [key=value ...]\n"
            << "  settlectl <addr> audit <batch_id> [--explain]\n"
            << "\n"
            << "  events.json   IngestEventsRequest in protobuf JSON form\n"
            << "  start, end    RFC 3339 timestamps, e.g. 2024-05-01T00:00:00Z\n"
            << "  key=value     policy parameter; numeric values are sent as numbers\n";
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static std::optional<google::protobuf::Timestamp> ParseTimestamp(const std::string& value) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(value, &ts)) {
    return std::nullopt;
  }
  return ts;
}

// use_case start end [key=value ...] starting at argv[first]
static bool BuildPolicyAndWindow(int argc, char** argv, int first, PolicySpec* policy, TimeWindow* window) {
  if (argc < first + 3) return false;

  policy->set_use_case(argv[first]);

  auto start = ParseTimestamp(argv[first + 1]);
  auto end   = ParseTimestamp(argv[first + 2]);
  if (!start || !end) {
    std::cerr << "invalid timestamp; expected RFC 3339\n";
    return false;
  }
  *window->mutable_start() = *start;
  *window->mutable_end()   = *end;

  for (int i = first + 3; i < argc; ++i) {
    std::string arg = argv[i];
    auto        eq  = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid parameter '" << arg << "', expected key=value\n";
      return false;
    }
    const auto key   = arg.substr(0, eq);
    const auto value = arg.substr(eq + 1);

    auto& entry  = (*policy->mutable_parameters())[key];
    char* endptr = nullptr;
    const double number = std::strtod(value.c_str(), &endptr);
    if (!value.empty() && endptr && *endptr == '\0') {
      entry.set_number_value(number);
    } else {
      entry.set_string_value(value);
    }
  }
  return true;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SettlementService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    IngestEventsRequest req;
    auto                parse_status = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
    if (!parse_status.ok()) {
      std::cerr << "invalid events file: " << parse_status.message() << "\n";
      return 1;
    }

    IngestEventsResponse resp;
    auto                 status = stub->IngestEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "policy") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetDefaultPolicyRequest req;
    req.set_use_case(argv[3]);

    GetDefaultPolicyResponse resp;
    auto                     status = stub->GetDefaultPolicy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "preview") {
    PreviewNettingRequest req;
    if (!BuildPolicyAndWindow(argc, argv, 3, req.mutable_policy(), req.mutable_window())) {
      Usage();
      return 1;
    }

    PreviewNettingResponse resp;
    auto                   status = stub->PreviewNetting(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "execute") {
    ExecuteSettlementRequest req;
    if (!BuildPolicyAndWindow(argc, argv, 3, req.mutable_policy(), req.mutable_window())) {
      Usage();
      return 1;
    }

    ExecuteSettlementResponse resp;
    auto                      status = stub->ExecuteSettlement(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    const auto batch_id = settlectl::ParseBatchId(argv[3]);
    if (!batch_id) {
      std::cerr << "invalid batch id '" << argv[3] << "'\n";
      Usage();
      return 1;
    }

    GetAuditReportRequest req;
    req.set_batch_id(*batch_id);
    if (argc >= 5 && std::string(argv[4]) == "--explain") {
      req.set_explain(true);
    }

    GetAuditReportResponse resp;
    auto                   status = stub->GetAuditReport(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);

    const auto& report = resp.report();
    return report.verified_lines() == report.total_lines() ? 0 : 3;
  }

  Usage();
  return 1;
}
