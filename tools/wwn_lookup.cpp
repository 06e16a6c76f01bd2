/**
 * @file wwn_lookup.cpp
 * @author Carlos Salguero
 * @brief WWN decoding and vendor lookup tool
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Command-line front end decoding World Wide Names and resolving their
 * vendor through the IEEE OUI registry.
 */

#include <wwnlookup/core/logger.hpp>
#include <wwnlookup/oui/registry.hpp>
#include <wwnlookup/oui/registry_source.hpp>
#include <wwnlookup/utils/expected.hpp>
#include <wwnlookup/wwn/decoder.hpp>
#include <wwnlookup/wwn/formatter.hpp>

#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

using namespace wwnlookup;

namespace {
/**
 * @brief Parsed command line
 */
struct Options {
  std::string command;
  std::vector<std::string> arguments;
  oui::RegistryConfig registry;
  core::LogLevel log_level{core::LogLevel::Warning};
  bool help{false};
};

/**
 * @brief Print usage information
 */
void print_usage(std::string_view program_name) {
  std::cout << fmt::format(R"(Usage: {0} [COMMAND] [ARGS] [OPTIONS]

COMMANDS:
  decode WWN          Show NAA, OUI, vendor sequence, extension and vendor
  nice WWN            Print the bracketed form of a WWN
  vendor WWN          Print the vendor name of a WWN
  valid WWN           Exit with 0 when the WWN is valid, 1 otherwise
  stats               Show OUI registry statistics
  download [FILE]     Download the IEEE OUI registry to FILE (or the cache)

OPTIONS:
  -c, --cache FILE    OUI registry cache file (default: {1})
  -u, --url URL       OUI registry URL (default: {2})
  -v, --verbose       Verbose output
  -h, --help          Show this help
  --log-level LEVEL   Set log level (trace,debug,info,warn,error,critical,off)

EXAMPLES:
  {0} nice 50:06:01:60:08:60:2c:04     # [5][06:01:60][08:60:2c:04]
  {0} vendor 5006016008602c04          # Vendor of the embedded OUI
  {0} decode 60060e80...               # All fields of a 128-bit WWN
)",
                           program_name, oui::default_cache_path().string(),
                           oui::DEFAULT_REGISTRY_URL);
}

utils::Expected<Options> parse_options(int argc, char *argv[]) {
  Options options;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next_value = [&](std::string_view flag) -> utils::Expected<std::string> {
      if (i + 1 >= argc) {
        return tl::unexpected{utils::make_validation_error(
            fmt::format("{} requires a value", flag))};
      }

      return std::string{argv[++i]};
    };

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.log_level = core::LogLevel::Debug;
    } else if (arg == "-c" || arg == "--cache") {
      options.registry.cache_path = WL_TRY(next_value(arg));
    } else if (arg == "-u" || arg == "--url") {
      options.registry.url = WL_TRY(next_value(arg));
    } else if (arg == "--log-level") {
      auto value = WL_TRY(next_value(arg));
      options.log_level = WL_TRY(core::parse_log_level(value));
    } else if (options.command.empty()) {
      options.command = std::string{arg};
    } else {
      options.arguments.emplace_back(arg);
    }
  }

  return options;
}

utils::Expected<std::string> require_wwn(const Options &options) {
  if (options.arguments.empty()) {
    return tl::unexpected{utils::make_validation_error(
        fmt::format("{} command requires a WWN", options.command))};
  }

  return options.arguments.front();
}

utils::Expected<int> decode_command(const Options &options,
                                    const oui::OuiRegistry &registry) {
  auto input = WL_TRY(require_wwn(options));
  auto fields = WL_TRY(wwn::WwnFields::decode(input));

  std::cout << fmt::format("WWN: {}\n", wwn::nice_wwn(fields.normalized));
  std::cout << fmt::format("NAA: {} ({})\n", wwn::naa_to_string(fields.naa),
                           wwn::naa_description(fields.naa));
  std::cout << fmt::format("OUI: {}\n", wwn::colon_pairs(fields.oui));
  std::cout << fmt::format("Vendor Sequence: {}\n",
                           wwn::colon_pairs(fields.vendor_sequence));

  if (fields.vendor_specific_extension) {
    std::cout << fmt::format("Vendor Extension: {}\n",
                             wwn::colon_pairs(*fields.vendor_specific_extension));
  }

  auto vendor = registry.resolve(fields.oui);
  std::cout << fmt::format("Vendor: {}\n", vendor.value_or("Unknown"));
  return 0;
}

utils::Expected<int> nice_command(const Options &options) {
  auto input = WL_TRY(require_wwn(options));
  auto fields = WL_TRY(wwn::WwnFields::decode(input));

  std::cout << wwn::nice_wwn(fields.normalized) << '\n';
  return 0;
}

utils::Expected<int> vendor_command(const Options &options,
                                    const oui::OuiRegistry &registry) {
  auto input = WL_TRY(require_wwn(options));
  auto fields = WL_TRY(wwn::WwnFields::decode(input));

  auto vendor = wwn::vendor_from_wwn(fields.normalized, registry);
  if (!vendor) {
    std::cerr << fmt::format("No vendor registered for OUI {}\n",
                             wwn::colon_pairs(fields.oui));
    return 1;
  }

  std::cout << *vendor << '\n';
  return 0;
}

utils::Expected<int> download_command(const Options &options,
                                      oui::RegistrySource &source) {
  std::filesystem::path output = options.registry.cache_path;
  if (!options.arguments.empty()) {
    output = options.arguments.front();
  }

  auto text = WL_LOG_TRY(source.fetch_network(options.registry.url),
                         "Download failed");
  auto written = source.write_cache(output, text);
  if (!written) {
    WL_ERROR_LOG(core::LogContext{}.with_error(written.error()),
                 "Saving registry failed");
    return tl::unexpected{std::move(written.error())};
  }

  std::cout << fmt::format("Downloaded IEEE OUI registry ({} bytes) to {}\n",
                           text.size(), output.string());
  return 0;
}

/**
 * @brief Main application logic
 */
utils::Expected<int> run_application(int argc, char *argv[]) {
  auto options = WL_TRY(parse_options(argc, argv));
  if (options.help || options.command.empty()) {
    print_usage(argv[0]);
    return options.help ? 0 : 1;
  }

  core::LoggerConfig log_config{.level = options.log_level,
                                .enable_console = true,
                                .enable_file = false};
  WL_TRY_VOID(core::Logger::initialize(log_config));
  WL_DEBUG("wwn_lookup starting: {}", options.command);

  oui::SystemRegistrySource source{options.registry.timeout};
  oui::OuiRegistry registry{source, options.registry};

  const std::string &command = options.command;
  if (command == "decode") {
    return decode_command(options, registry);
  } else if (command == "nice") {
    return nice_command(options);
  } else if (command == "vendor") {
    return vendor_command(options, registry);
  } else if (command == "valid") {
    auto input = WL_TRY(require_wwn(options));
    return wwn::is_valid(input) ? 0 : 1;
  } else if (command == "stats") {
    std::cout << registry.statistics().to_string();
    return 0;
  } else if (command == "download") {
    return download_command(options, source);
  }

  return tl::unexpected{utils::make_validation_error(
      fmt::format("Unknown command: {}", command))};
}
} // namespace

/**
 * @brief Application entry point
 */
int main(int argc, char *argv[]) {
  int exit_code = 1;

  try {
    auto result = run_application(argc, argv);
    if (!result) {
      std::cerr << "Error: " << result.error().what() << std::endl;
    } else {
      exit_code = *result;
    }
  } catch (const std::exception &e) {
    std::cerr << "Unhandled exception: " << e.what() << std::endl;
  }

  spdlog::shutdown();
  return exit_code;
}
