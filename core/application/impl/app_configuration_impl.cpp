/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

namespace {

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  const bool def_quiet = false;

}  // namespace

namespace dotquad::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)), quiet_(def_quiet) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    if (not m->value.IsArray()) {
      return false;
    }
    std::vector<std::string> values;
    for (auto &v : m->value.GetArray()) {
      if (not v.IsString()) {
        return false;
      }
      values.emplace_back(v.GetString(), v.GetStringLength());
    }
    target.insert(target.end(), values.begin(), values.end());
    return not values.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_bool(const rapidjson::Value &val,
                                       const char *name,
                                       bool &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsBool()) {
      target = m->value.GetBool();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_input_segment(const rapidjson::Value &val) {
    std::string input_path;
    if (load_str(val, "file", input_path)) {
      input_path_ = std::move(input_path);
    }
    if (not load_ms(val, "addresses", addresses_)) {
      SL_DEBUG(logger_, "No addresses list in the input segment");
    }
  }

  void AppConfigurationImpl::parse_output_segment(
      const rapidjson::Value &val) {
    load_bool(val, "quiet", quiet_);
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer{};
    FileReadStream input_stream(file.get(), buffer.data(), buffer.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not a JSON object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::validate_config() {
    if (addresses_.empty() and not input_path_.has_value()) {
      SL_ERROR(logger_,
               "No addresses to check, "
               "pass them as arguments or specify input with -i option");
      return false;
    }
    if (input_path_.has_value() and input_path_->empty()) {
      SL_ERROR(logger_, "Input file path is empty");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lapplication=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to YAML configuration of logging")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description input_desc("Input options");
    input_desc.add_options()
        ("input,i", po::value<std::string>(), "file with one address per line, `-` to read standard input")
        ("quiet,q", po::bool_switch(), "do not print verdict for each address, only exit code reports the result")
        ;

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options()
        ("address", po::value<std::vector<std::string>>(), "address to check")
        ;
    // clang-format on

    po::positional_options_description positional;
    positional.add("address", -1);

    desc.add(input_desc);

    po::options_description all_desc;
    all_desc.add(desc).add(hidden_desc);

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(all_desc)
                    .positional(positional)
                    .run(),
                vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << "Usage: dotquad [options] [address...]\n";
      std::cout << desc << std::endl;
      return false;
    }

    bool config_is_read = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      config_is_read = read_config_from_file(path);
    });
    if (not config_is_read) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });

    find_argument<std::vector<std::string>>(
        vm, "address", [&](const std::vector<std::string> &val) {
          addresses_ = val;
        });

    find_argument<std::string>(
        vm, "input", [&](const std::string &val) { input_path_ = val; });

    if (find_argument(vm, "quiet") and vm["quiet"].as<bool>()) {
      quiet_ = true;
    }

    // if something wrong with config print help message
    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }

    SL_DEBUG(logger_,
             "Configured {} explicit address(es), input: {}",
             addresses_.size(),
             input_path_.value_or("none"));
    return true;
  }

}  // namespace dotquad::application
