#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "client/cpp/transcription_client.h"
#include "transcription/manager/v1.hpp"

using namespace transcription::manager::v1;
using transcription::manager::client::TranscriptionClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  transcriptionctl <addr> submit <file> <provider> [language] [owner]\n"
            << "  transcriptionctl <addr> youtube <url> <provider> [language] [owner]\n"
            << "  transcriptionctl <addr> status <job_id>\n"
            << "  transcriptionctl <addr> wait <job_id> [timeout_s]\n"
            << "  transcriptionctl <addr> regenerate <job_id> [provider] [language] [owner]\n"
            << "  transcriptionctl <addr> delete <job_id> [owner]\n"
            << "  transcriptionctl <addr> list [owner]\n"
            << "  transcriptionctl <addr> summarize <job_id>\n";
}

static std::string Arg(int argc, char** argv, int index, const std::string& fallback = "") {
  return index < argc ? std::string(argv[index]) : fallback;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "json: " << std::string(status.message()) << "\n";
    return;
  }
  std::cout << json;
}

static void PrintSubmit(const JobView& job, SubmitDisposition disposition) {
  std::cout << "job=" << job.job_id() << " status=" << JobStatus_Name(job.status()) << " disposition=" << SubmitDisposition_Name(disposition) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  // uploads travel inline
  grpc::ChannelArguments args;
  args.SetMaxSendMessageSize(-1);
  TranscriptionClient client(grpc::CreateCustomChannel(addr, grpc::InsecureChannelCredentials(), args));

  // ------------------------------------------------------------
  if (cmd == "submit" || cmd == "youtube") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    const auto language = Arg(argc, argv, 5, "auto");
    const auto owner    = Arg(argc, argv, 6);
    auto       result   = cmd == "submit" ? client.SubmitFile(argv[3], argv[4], language, owner) : client.SubmitYoutube(argv[3], argv[4], language, owner);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    PrintSubmit(result->job(), result->disposition());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "status") {
    if (argc < 4) return 1;
    auto job = client.GetStatus(argv[3]);
    if (!job.ok()) {
      std::cerr << job.status().ToString() << "\n";
      return 2;
    }
    PrintJson(*job);
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "wait") {
    if (argc < 4) return 1;
    const std::int64_t timeout_s = std::stoll(Arg(argc, argv, 4, "0"));
    auto               job       = client.WaitForCompletion(argv[3], std::chrono::seconds(2), std::chrono::seconds(timeout_s));
    if (!job.ok()) {
      std::cerr << job.status().ToString() << "\n";
      return 2;
    }
    PrintJson(*job);
    return job->status() == JOB_STATUS_COMPLETED ? 0 : 3;
  }

  // ------------------------------------------------------------
  if (cmd == "regenerate") {
    if (argc < 4) return 1;
    RegenerateRequest req;
    req.set_job_id(argv[3]);
    req.set_provider(Arg(argc, argv, 4));
    req.set_language(Arg(argc, argv, 5));
    req.set_owner(Arg(argc, argv, 6));
    auto result = client.Regenerate(req);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    PrintSubmit(result->job(), result->disposition());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "delete") {
    if (argc < 4) return 1;
    auto status = client.Delete(argv[3], Arg(argc, argv, 4));
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "list") {
    auto result = client.ListJobs(Arg(argc, argv, 3));
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    for (const auto& job : result->jobs()) {
      std::cout << job.job_id() << "\t" << JobStatus_Name(job.status()) << "\t" << job.provider() << "\t" << job.language() << "\t"
                << (job.is_youtube() ? "youtube" : "upload") << "\t" << job.file_name() << (job.has_summary() ? "\tsummarized" : "") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "summarize") {
    if (argc < 4) return 1;
    auto summary = client.Summarize(argv[3]);
    if (!summary.ok()) {
      std::cerr << summary.status().ToString() << "\n";
      return 2;
    }
    PrintJson(*summary);
    return 0;
  }

  Usage();
  return 1;
}
