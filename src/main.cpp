#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <equimint/cli/commands.hpp>
#include <equimint/cli/options.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = equimint::cli::parse_options(argc, argv, error);
  if (!options.has_value()) {
    std::cerr << "error: " << error << "\n\n" << equimint::cli::usage();
    return equimint::cli::kExitUsage;
  }
  if (options->help) {
    std::cout << equimint::cli::usage();
    return equimint::cli::kExitOk;
  }

  spdlog::init_thread_pool(8192, 1);

  // Command output owns stdout; logs go to stderr and the optional file.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!options->log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options->log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "equimint", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options->log_level));

  spdlog::debug("Running {} against '{}'",
                equimint::cli::to_string(options->action), options->db_path);
  auto code = equimint::cli::run(options.value(), std::cout, std::cerr);

  spdlog::shutdown();
  return code;
}
