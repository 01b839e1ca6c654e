#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <codejudge/judge.h>
#include <codejudge/utils.h>
#include <codejudge/config.h>
#include <codejudge/logger.h>

namespace fs = std::filesystem;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitInvalidTestCases = 2;

struct Args {
  JudgeConfig config;
  fs::path code_file, testcases_file, output_file;
};

bool ReadText(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return !fin.bad();
}

void ParseArgs(int argc, char** argv, Args& args) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codejudge");
  parser.add_argument("code")
    .help("Python source file defining the entry point");
  parser.add_argument("testcases")
    .help("JSON file of [{\"input\": ..., \"output\": ...}, ...]");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/codejudge.conf"))
    .help("Path of configuration file; ignored if it does not exist");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--backend")
    .help("Isolation backend: docker or cjail");
  parser.add_argument("--timeout")
    .scan<'g', double>()
    .help("Wall-clock limit per test case in seconds");
  parser.add_argument("--memory")
    .scan<'d', long>()
    .help("Memory limit in MiB");
  parser.add_argument("--cpus")
    .scan<'g', double>()
    .help("CPU cores available to the code, may be fractional");
  parser.add_argument("--entry-point")
    .help("Name of the function to call");
  parser.add_argument("-o", "--output")
    .default_value(std::string(""))
    .help("Write the result to this file instead of stdout");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitUsage);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  std::error_code ec;
  if (fs::exists(config_file, ec)) {
    std::string error;
    if (!LoadConfig(config_file, args.config, error)) {
      spdlog::error("Failed to parse configuration file {}: {}", config_file.string(), error);
      exit(kExitUsage);
    }
  } else if (parser.is_used("--config")) {
    spdlog::error("Configuration file {} does not exist", config_file.string());
    exit(kExitUsage);
  }
  if (auto val = parser.present("--backend")) {
    if (!ParseBackendType(val.value(), args.config.backend)) {
      spdlog::error("Unknown backend {}", val.value());
      exit(kExitUsage);
    }
  }
  if (auto val = parser.present<double>("--timeout")) {
    args.config.limits.timeout_seconds = val.value();
  }
  if (auto val = parser.present<long>("--memory")) {
    args.config.limits.memory_mb = val.value();
  }
  if (auto val = parser.present<double>("--cpus")) {
    args.config.limits.cpu_fraction = val.value();
  }
  if (auto val = parser.present("--entry-point")) {
    args.config.invocation.entry_point = val.value();
  }
  args.code_file = parser.get<std::string>("code");
  args.testcases_file = parser.get<std::string>("testcases");
  args.output_file = parser.get<std::string>("--output");
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Args args;
  ParseArgs(argc, argv, args);

  std::string code, testcases_text;
  if (!ReadText(args.code_file, code)) {
    spdlog::error("Cannot read {}", args.code_file.string());
    return kExitUsage;
  }
  if (!ReadText(args.testcases_file, testcases_text)) {
    spdlog::error("Cannot read {}", args.testcases_file.string());
    return kExitUsage;
  }

  nlohmann::json output;
  std::vector<TestCase> cases;
  std::string error;
  int ret = 0;
  if (!ParseTestCases(testcases_text, cases, error)) {
    output = {
      {"status", OverallStatusName(OverallStatus::ERROR)},
      {"message", error},
      {"passed", 0},
      {"total", 0},
    };
    ret = kExitInvalidTestCases;
  } else {
    Judge judge(MakeBackend(args.config), args.config.judge);
    SubmissionResult result = judge.Run(code, cases, args.config.limits);
    output = ResultToJson(result, cases);
  }

  // stderr excerpts are raw bytes
  std::string text = output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  if (args.output_file.empty()) {
    std::cout << text << std::endl;
  } else {
    std::ofstream fout(args.output_file);
    if (!(fout << text << std::endl)) {
      spdlog::error("Cannot write {}", args.output_file.string());
      return kExitUsage;
    }
  }
  return ret;
}
