#include "cli.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <agentbox/errors.h>
#include <agentbox/paths.h>
#include <agentbox/retention.h>
#include <agentbox/sandbox.h>
#include "config_file.h"

const char kDefaultConfigPath[] = "/etc/agentbox.conf";

namespace {

bool ReadCode(const std::string& code_file, std::istream& in, std::string& code) {
  if (code_file == "-") {
    code.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream fin(code_file);
  if (!fin) return false;
  code.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

bool ReadVariables(const std::string& vars_file, Namespace& ns) {
  if (vars_file.empty()) return true;
  std::ifstream fin(vars_file);
  if (!fin) {
    spdlog::error("Cannot open variables file {}", vars_file);
    return false;
  }
  try {
    ns = NamespaceFromJson(nlohmann::json::parse(fin));
  } catch (const nlohmann::json::exception& ex) {
    spdlog::error("Malformed variables file {}: {}", vars_file, ex.what());
    return false;
  } catch (const std::invalid_argument& ex) {
    spdlog::error("Invalid variables in {}: {}", vars_file, ex.what());
    return false;
  }
  return true;
}

} // namespace

CliOptions ParseCommandLine(const std::vector<std::string>& args) {
  CliOptions opt;
  argparse::ArgumentParser parser(args.empty() ? "agentbox-run" : args[0]);
  parser.add_argument("code")
    .default_value(std::string("-"))
    .help("Python file to run, or - for stdin");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++opt.verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--vars")
    .default_value(std::string(""))
    .help("JSON object of variables offered to the code");
  parser.add_argument("--image")
    .help("Execution image tag");
  parser.add_argument("--state-root")
    .help("Directory holding generated runs and logs");
  parser.add_argument("--keep")
    .scan<'d', int>()
    .help("Number of run directories to retain");
  parser.add_argument("--allow-network")
    .default_value(false)
    .implicit_value(true)
    .help("Do not disable networking inside the container");
  parser.add_argument("--json")
    .default_value(false)
    .implicit_value(true)
    .help("Print the result as a JSON object");
  parser.add_argument("--prune-only")
    .default_value(false)
    .implicit_value(true)
    .help("Only apply the retention policy and exit");

  try {
    parser.parse_args(args);
  } catch (const std::exception& err) {
    // unknown flags surface as runtime_error, malformed numbers as invalid_argument
    std::ostringstream msg;
    msg << err.what() << std::endl << parser;
    throw std::invalid_argument(msg.str());
  }
  if (auto val = parser.present<int>("--keep")) {
    if (val.value() < 0) {
      std::ostringstream msg;
      msg << "--keep must not be negative" << std::endl << parser;
      throw std::invalid_argument(msg.str());
    }
    opt.keep = val.value();
  }
  opt.code_file = parser.get<std::string>("code");
  opt.vars_file = parser.get<std::string>("--vars");
  opt.config_file = parser.present("--config");
  opt.image = parser.present("--image");
  opt.state_root = parser.present("--state-root");
  opt.allow_network = parser["--allow-network"] == true;
  opt.json_output = parser["--json"] == true;
  opt.prune_only = parser["--prune-only"] == true;
  return opt;
}

bool ResolveConfig(const CliOptions& opt, SandboxConfig& config, const fs::path& default_config_path) {
  if (opt.config_file) {
    if (!LoadConfigFile(opt.config_file.value(), config)) {
      spdlog::error("Failed to parse configuration file {}", opt.config_file.value());
      return false;
    }
  } else if (fs::exists(default_config_path) && !LoadConfigFile(default_config_path, config)) {
    spdlog::error("Failed to parse configuration file {}", default_config_path.c_str());
    return false;
  }
  ApplyEnvironment(config);

  if (opt.state_root) {
    kStateRoot = opt.state_root.value();
    config.generated_root = GeneratedRoot();
  }
  if (opt.image) config.image = opt.image.value();
  if (opt.keep) config.max_sessions = opt.keep.value();
  if (opt.allow_network) config.runtime.disable_network = false;
  return true;
}

int RunCli(const CliOptions& opt, const SandboxConfig& config, std::unique_ptr<CommandRunner> runner,
           std::istream& in, std::ostream& out, std::ostream& err) {
  if (opt.prune_only) {
    size_t removed = PruneRunDirectories(config.generated_root, config.max_sessions);
    out << "removed " << removed << " run directories" << std::endl;
    return 0;
  }

  std::string code;
  if (!ReadCode(opt.code_file, in, code)) {
    spdlog::error("Cannot read code from {}", opt.code_file);
    return 1;
  }
  Namespace ns;
  if (!ReadVariables(opt.vars_file, ns)) return 1;

  ExecutionResult result;
  try {
    SandboxContext context(config, std::move(runner));
    result = context.Execute(code, ns);
  } catch (const SandboxError& ex) {
    spdlog::error("Sandbox failure: {}", ex.what());
    err << ex.what() << std::endl;
    return kInfraErrorExitCode;
  } catch (const std::system_error& ex) {
    spdlog::error("Cannot start process: {}", ex.what());
    err << ex.what() << std::endl;
    return kInfraErrorExitCode;
  }

  if (opt.json_output) {
    out << result.ToJson().dump(2) << std::endl;
  } else {
    out << result.stdout_text << std::flush;
    err << result.stderr_text << std::flush;
  }
  return result.exit_code;
}
